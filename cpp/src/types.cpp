#include "tiergate/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace tiergate
{

    std::optional<Tier> parse_tier_alias(std::string_view raw)
    {
        auto begin = raw.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return std::nullopt;
        auto end = raw.find_last_not_of(" \t\r\n");

        std::string v(raw.substr(begin, end - begin + 1));
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (v == "free")
            return Tier::Community;
        if (v == "all")
            return Tier::Enterprise;

        auto parsed = tier_from_string(v);
        if (!parsed)
            return std::nullopt;
        return *parsed;
    }

    Tier normalize_tier(std::string_view raw)
    {
        return parse_tier_alias(raw).value_or(Tier::Community);
    }

    Tier clamp_tier(Tier requested, Tier licensed)
    {
        return requested <= licensed ? requested : licensed;
    }

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::LicenseError:
            return "LicenseError";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::ProtocolError:
            return "ProtocolError";
        case ErrorCode::UntrustedVerifier:
            return "UntrustedVerifier";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::StartupError:
            return "StartupError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        }
        return "UnknownError";
    }

    std::optional<int64_t> checked_int64(double d)
    {
        if (!std::isfinite(d))
            return std::nullopt;
        const double t = std::trunc(d);
        // -2^63 and 2^63 are exact doubles
        if (t < -9223372036854775808.0 || t >= 9223372036854775808.0)
            return std::nullopt;
        return static_cast<int64_t>(t);
    }

} // namespace tiergate
