#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tiergate
{

    enum class SignatureAlgorithm
    {
        EdDSA, // Ed25519, production
        HS256  // HMAC-SHA-256, development only
    };

    std::string_view algorithm_name(SignatureAlgorithm alg);
    std::optional<SignatureAlgorithm> algorithm_from_name(std::string_view name);

    /**
     * Claims of a license token. Only produced after the signature has been
     * verified, and never mutated afterwards.
     */
    struct LicenseClaims
    {
        std::string issuer;
        std::vector<std::string> audience; // "aud" may be a string or an array
        std::string subject; // customer id
        std::string jti;
        Tier tier{Tier::Community};
        std::set<std::string> features;
        std::optional<std::string> organization;
        std::optional<int64_t> seats;
        int64_t issued_at{0};
        int64_t expires_at{0};
        std::optional<int64_t> not_before;

        /** Extract claims from a decoded payload; fails on missing or mistyped claims. */
        static Result<LicenseClaims> from_json(const nlohmann::json &payload);
    };

    struct ValidationResult
    {
        bool is_valid{false};
        bool is_expired{false};
        bool is_in_grace_period{false};
        Tier tier{Tier::Community};
        std::string customer_id;
        std::optional<std::string> organization;
        std::optional<int64_t> seats;
        std::set<std::string> features;
        std::optional<std::string> error_message;
        std::optional<int64_t> days_until_expiration;
        std::optional<LicenseClaims> claims;

        static ValidationResult invalid(std::string message);

        /** Result used when no license is present: community is always valid. */
        static ValidationResult community();

        nlohmann::json to_json() const;
    };

    struct TokenValidatorConfig
    {
        std::optional<crypto::Ed25519PublicKey> public_key;
        std::string secret_key;       // HS256 development secret
        bool allow_symmetric{false};  // explicit opt-in for HS256
        std::string issuer{"tiergate-licensing"};
        std::string audience{"tiergate"};
        int grace_days{7};
    };

    /**
     * Verification seam used by the local evaluator. Implementations must not
     * throw and must not have side effects.
     */
    class TokenVerifier
    {
    public:
        virtual ~TokenVerifier() = default;

        virtual ValidationResult validate_token(
            std::string_view token,
            std::chrono::system_clock::time_point now) const = 0;
    };

    /**
     * Compact token codec: base64url(header).base64url(payload).base64url(signature).
     */
    struct DecodedToken
    {
        nlohmann::json header;
        nlohmann::json payload;
        std::string signing_input; // "header.payload" as transmitted
        crypto::Bytes signature;

        static Result<DecodedToken> decode(std::string_view token);
    };

    class TokenValidator : public TokenVerifier
    {
    public:
        explicit TokenValidator(TokenValidatorConfig cfg);

        ValidationResult validate_token(
            std::string_view token,
            std::chrono::system_clock::time_point now) const override;

        const TokenValidatorConfig &config() const { return cfg_; }

    private:
        Result<void> verify_signature(SignatureAlgorithm alg, const DecodedToken &decoded) const;
        Result<void> verify_registered_claims(const LicenseClaims &claims) const;

        TokenValidatorConfig cfg_;
    };

} // namespace tiergate
