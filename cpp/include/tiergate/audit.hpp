#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>

namespace tiergate
{
    /**
     * One entitlement event. `resource` carries a token hash hint, never the token.
     */
    struct AuditEvent
    {
        std::string ts;
        std::string actor;
        std::string action;
        std::string resource;
        std::string result;
        nlohmann::json details;

        static AuditEvent at(std::chrono::system_clock::time_point tp, std::string actor, std::string action,
                             std::string resource, std::string result,
                             nlohmann::json details = nlohmann::json::object());

        nlohmann::json to_json() const;
    };

    /**
     * Emits audit events as single JSON lines on the "tiergate.audit" logger.
     * That logger stays at info regardless of the diagnostic log level.
     */
    class AuditLogger
    {
    public:
        AuditLogger();
        explicit AuditLogger(std::shared_ptr<spdlog::logger> logger);

        void log(const AuditEvent &event);

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    /** UTC timestamp with millisecond precision, e.g. 2026-01-02T03:04:05.678Z */
    std::string to_iso8601(std::chrono::system_clock::time_point tp);

} // namespace tiergate
