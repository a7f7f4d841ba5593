#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include <format>

namespace tiergate
{

    /**
     * Feature tier hierarchy. Ordering is the capability rank.
     */
    enum class Tier
    {
        Community = 0,
        Pro = 1,
        Enterprise = 2
    };

    /**
     * Convert Tier to its wire/string representation
     */
    inline std::string tier_to_string(Tier tier)
    {
        switch (tier)
        {
        case Tier::Community:
            return "community";
        case Tier::Pro:
            return "pro";
        case Tier::Enterprise:
            return "enterprise";
        }
        return "community";
    }

    /**
     * Parse a canonical tier name ("community", "pro", "enterprise")
     */
    inline std::expected<Tier, std::string> tier_from_string(std::string_view s)
    {
        if (s == "community")
            return Tier::Community;
        if (s == "pro")
            return Tier::Pro;
        if (s == "enterprise")
            return Tier::Enterprise;
        return std::unexpected(std::format("Invalid tier: {}", s));
    }

    inline int tier_rank(Tier tier)
    {
        return static_cast<int>(tier);
    }

    inline bool operator>=(Tier a, Tier b)
    {
        return tier_rank(a) >= tier_rank(b);
    }

    inline bool operator<=(Tier a, Tier b)
    {
        return tier_rank(a) <= tier_rank(b);
    }

    inline bool operator>(Tier a, Tier b)
    {
        return tier_rank(a) > tier_rank(b);
    }

    inline bool operator<(Tier a, Tier b)
    {
        return tier_rank(a) < tier_rank(b);
    }

    /**
     * Normalize a user- or verifier-supplied tier name. Trims and lowercases,
     * maps "free" to community and "all" to enterprise. Returns nullopt for
     * anything else.
     */
    std::optional<Tier> parse_tier_alias(std::string_view raw);

    /**
     * Like parse_tier_alias, but clamps unknown or empty input to community.
     */
    Tier normalize_tier(std::string_view raw);

    /** Lower of the two tiers. */
    Tier clamp_tier(Tier requested, Tier licensed);

    /** d truncated toward zero; nullopt when d is not finite or does not fit in int64_t. */
    std::optional<int64_t> checked_int64(double d);

    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        LicenseError,
        NetworkError,
        ProtocolError,
        UntrustedVerifier,
        StorageError,
        StartupError,
        InvalidInput,
        NotFound,
        IOError,
        ParsingError
    };

    std::string_view error_code_name(ErrorCode code);

    /**
     * Tiergate error with code and message
     */
    class TiergateError : public std::runtime_error
    {
    public:
        ErrorCode code;

        TiergateError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static TiergateError config(const std::string &msg)
        {
            return TiergateError(ErrorCode::ConfigError, msg);
        }

        static TiergateError crypto(const std::string &msg)
        {
            return TiergateError(ErrorCode::CryptoError, msg);
        }

        static TiergateError license(const std::string &msg)
        {
            return TiergateError(ErrorCode::LicenseError, msg);
        }

        static TiergateError network(const std::string &msg)
        {
            return TiergateError(ErrorCode::NetworkError, msg);
        }

        static TiergateError protocol(const std::string &msg)
        {
            return TiergateError(ErrorCode::ProtocolError, msg);
        }

        static TiergateError untrusted_verifier(const std::string &msg)
        {
            return TiergateError(ErrorCode::UntrustedVerifier, msg);
        }

        static TiergateError storage(const std::string &msg)
        {
            return TiergateError(ErrorCode::StorageError, msg);
        }

        static TiergateError startup(const std::string &msg)
        {
            return TiergateError(ErrorCode::StartupError, msg);
        }

        static TiergateError invalid_input(const std::string &msg)
        {
            return TiergateError(ErrorCode::InvalidInput, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, TiergateError>;

} // namespace tiergate
