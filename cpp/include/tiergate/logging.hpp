#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace tiergate::logging
{
    /**
     * Shared "tiergate" logger writing to stderr. Created on first use so that
     * library consumers that never call init() still get a sink.
     */
    std::shared_ptr<spdlog::logger> get();

    /**
     * "tiergate.audit" logger on stderr, fixed at info. init() does not touch it.
     */
    std::shared_ptr<spdlog::logger> audit_logger();

    /** Parse "debug|info|warning|error|critical" into an spdlog level. */
    Result<spdlog::level::level_enum> parse_level(std::string_view name);

    /** Set the level of the shared logger. */
    void init(spdlog::level::level_enum level);

    /**
     * Short, non-sensitive identifier for a token hash: first and last six hex
     * characters. Short inputs are returned unchanged.
     */
    std::string hash_hint(std::string_view token_hash);

} // namespace tiergate::logging
