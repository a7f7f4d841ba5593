#include "tiergate/audit.hpp"
#include "tiergate/logging.hpp"
#include <chrono>
#include <format>

namespace tiergate
{

    std::string to_iso8601(std::chrono::system_clock::time_point tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    AuditEvent AuditEvent::at(std::chrono::system_clock::time_point tp, std::string actor, std::string action,
                              std::string resource, std::string result, nlohmann::json details)
    {
        return AuditEvent{to_iso8601(tp),
                          std::move(actor),
                          std::move(action),
                          std::move(resource),
                          std::move(result),
                          std::move(details)};
    }

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    AuditLogger::AuditLogger() : AuditLogger(logging::audit_logger()) {}

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    void AuditLogger::log(const AuditEvent &event)
    {
        logger_->info(event.to_json().dump());
    }

} // namespace tiergate
