#include "tiergate/logging.hpp"
#include <spdlog/sinks/stderr_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>

namespace tiergate::logging
{

    std::shared_ptr<spdlog::logger> get()
    {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> logger;
        std::call_once(once, [] {
            logger = spdlog::get("tiergate");
            if (!logger)
            {
                // stdout is reserved for command output / stdio transports
                logger = spdlog::stderr_color_mt("tiergate");
                logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n] [%l] %v");
                logger->set_level(spdlog::level::warn);
            }
        });
        return logger;
    }

    std::shared_ptr<spdlog::logger> audit_logger()
    {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> logger;
        std::call_once(once, [] {
            logger = spdlog::get("tiergate.audit");
            if (!logger)
            {
                logger = spdlog::stderr_color_mt("tiergate.audit");
                logger->set_pattern("%v");
                logger->set_level(spdlog::level::info);
            }
        });
        return logger;
    }

    Result<spdlog::level::level_enum> parse_level(std::string_view name)
    {
        std::string v(name);
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (v == "debug")
            return spdlog::level::debug;
        if (v == "info")
            return spdlog::level::info;
        if (v == "warning" || v == "warn")
            return spdlog::level::warn;
        if (v == "error")
            return spdlog::level::err;
        if (v == "critical" || v == "alert")
            return spdlog::level::critical;
        return std::unexpected(TiergateError::config(std::format("Invalid log level: {}", name)));
    }

    void init(spdlog::level::level_enum level)
    {
        get()->set_level(level);
    }

    std::string hash_hint(std::string_view token_hash)
    {
        auto begin = token_hash.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto end = token_hash.find_last_not_of(" \t\r\n");
        auto h = token_hash.substr(begin, end - begin + 1);
        if (h.size() <= 12)
            return std::string(h);
        return std::format("{}...{}", h.substr(0, 6), h.substr(h.size() - 6));
    }

} // namespace tiergate::logging
