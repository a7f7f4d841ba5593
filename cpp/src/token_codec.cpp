#include "tiergate/token_codec.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace tiergate
{

    namespace
    {
        constexpr int64_t kSecondsPerDay = 24 * 60 * 60;
        // 9999-12-31T23:59:59Z; keeps date arithmetic on claims overflow-free
        constexpr int64_t kMaxEpochSeconds = 253'402'300'799;

        std::string_view trim(std::string_view s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        Result<nlohmann::json> decode_json_segment(const std::string &segment, std::string_view what)
        {
            auto raw = crypto::Base64::decode_url_safe(segment);
            if (!raw)
            {
                return std::unexpected(TiergateError::invalid_input(
                    std::format("{} is not valid base64url", what)));
            }
            try
            {
                auto parsed = nlohmann::json::parse(raw->begin(), raw->end());
                if (!parsed.is_object())
                {
                    return std::unexpected(TiergateError::invalid_input(
                        std::format("{} is not a JSON object", what)));
                }
                return parsed;
            }
            catch (const nlohmann::json::exception &)
            {
                return std::unexpected(TiergateError::invalid_input(
                    std::format("{} is not valid JSON", what)));
            }
        }

        std::optional<int64_t> numeric_claim(const nlohmann::json &payload, const char *name)
        {
            auto it = payload.find(name);
            if (it == payload.end() || !it->is_number())
                return std::nullopt;
            if (it->is_number_float())
                return checked_int64(std::floor(it->get<double>()));
            if (it->is_number_unsigned())
            {
                const auto u = it->get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max()))
                    return std::nullopt;
                return static_cast<int64_t>(u);
            }
            return it->get<int64_t>();
        }

        std::optional<int64_t> date_claim(const nlohmann::json &payload, const char *name)
        {
            auto value = numeric_claim(payload, name);
            if (!value || *value < -kMaxEpochSeconds || *value > kMaxEpochSeconds)
                return std::nullopt;
            return value;
        }

        int64_t to_epoch_seconds(std::chrono::system_clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
        }

        int64_t floor_div(int64_t a, int64_t b)
        {
            int64_t q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0)))
                --q;
            return q;
        }

        void copy_entitlements(const LicenseClaims &claims, ValidationResult &out)
        {
            out.tier = claims.tier;
            out.customer_id = claims.subject;
            out.organization = claims.organization;
            out.seats = claims.seats;
            out.features = claims.features;
        }
    } // namespace

    std::string_view algorithm_name(SignatureAlgorithm alg)
    {
        switch (alg)
        {
        case SignatureAlgorithm::EdDSA:
            return "EdDSA";
        case SignatureAlgorithm::HS256:
            return "HS256";
        }
        return "unknown";
    }

    std::optional<SignatureAlgorithm> algorithm_from_name(std::string_view name)
    {
        if (name == "EdDSA")
            return SignatureAlgorithm::EdDSA;
        if (name == "HS256")
            return SignatureAlgorithm::HS256;
        return std::nullopt;
    }

    // ============================================================================
    // LicenseClaims
    // ============================================================================

    Result<LicenseClaims> LicenseClaims::from_json(const nlohmann::json &payload)
    {
        for (const char *required : {"tier", "exp", "iat", "sub"})
        {
            if (!payload.contains(required))
            {
                return std::unexpected(TiergateError::license(
                    std::format("Missing required claim: {}", required)));
            }
        }

        LicenseClaims claims;

        if (!payload["tier"].is_string())
            return std::unexpected(TiergateError::license("Claim 'tier' must be a string"));
        auto tier = parse_tier_alias(payload["tier"].get<std::string>());
        if (!tier)
        {
            return std::unexpected(TiergateError::license(
                std::format("Unknown tier claim: {}", payload["tier"].get<std::string>())));
        }
        claims.tier = *tier;

        if (!payload["sub"].is_string())
            return std::unexpected(TiergateError::license("Claim 'sub' must be a string"));
        claims.subject = payload["sub"].get<std::string>();

        auto exp = date_claim(payload, "exp");
        auto iat = date_claim(payload, "iat");
        if (!exp)
            return std::unexpected(TiergateError::license("Claim 'exp' must be a numeric date"));
        if (!iat)
            return std::unexpected(TiergateError::license("Claim 'iat' must be a numeric date"));
        claims.expires_at = *exp;
        claims.issued_at = *iat;

        if (payload.contains("nbf"))
        {
            auto nbf = date_claim(payload, "nbf");
            if (!nbf)
                return std::unexpected(TiergateError::license("Claim 'nbf' must be a numeric date"));
            claims.not_before = *nbf;
        }

        if (auto it = payload.find("iss"); it != payload.end() && it->is_string())
            claims.issuer = it->get<std::string>();

        if (auto it = payload.find("aud"); it != payload.end())
        {
            if (it->is_string())
            {
                claims.audience.push_back(it->get<std::string>());
            }
            else if (it->is_array())
            {
                for (const auto &a : *it)
                {
                    if (a.is_string())
                        claims.audience.push_back(a.get<std::string>());
                }
            }
        }

        if (auto it = payload.find("jti"); it != payload.end() && it->is_string())
            claims.jti = it->get<std::string>();

        if (auto it = payload.find("features"); it != payload.end() && it->is_array())
        {
            for (const auto &f : *it)
            {
                if (f.is_string())
                    claims.features.insert(f.get<std::string>());
            }
        }

        if (auto it = payload.find("organization"); it != payload.end() && it->is_string())
            claims.organization = it->get<std::string>();

        claims.seats = numeric_claim(payload, "seats");

        return claims;
    }

    // ============================================================================
    // ValidationResult
    // ============================================================================

    ValidationResult ValidationResult::invalid(std::string message)
    {
        ValidationResult r;
        r.is_valid = false;
        r.error_message = std::move(message);
        return r;
    }

    ValidationResult ValidationResult::community()
    {
        ValidationResult r;
        r.is_valid = true;
        r.tier = Tier::Community;
        return r;
    }

    nlohmann::json ValidationResult::to_json() const
    {
        nlohmann::json j;
        j["tier"] = tier_to_string(tier);
        j["customer_id"] = customer_id;
        j["organization"] = organization ? nlohmann::json(*organization) : nlohmann::json(nullptr);
        j["features"] = std::vector<std::string>(features.begin(), features.end());
        j["seats"] = seats ? nlohmann::json(*seats) : nlohmann::json(nullptr);
        j["expiration"] = claims ? nlohmann::json(claims->expires_at) : nlohmann::json(nullptr);
        j["issued_at"] = claims ? nlohmann::json(claims->issued_at) : nlohmann::json(nullptr);
        j["is_valid"] = is_valid;
        j["is_expired"] = is_expired;
        j["is_in_grace_period"] = is_in_grace_period;
        j["days_until_expiration"] = days_until_expiration ? nlohmann::json(*days_until_expiration)
                                                           : nlohmann::json(nullptr);
        j["error_message"] = error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr);
        return j;
    }

    // ============================================================================
    // DecodedToken
    // ============================================================================

    Result<DecodedToken> DecodedToken::decode(std::string_view token)
    {
        auto first = token.find('.');
        if (first == std::string_view::npos)
            return std::unexpected(TiergateError::invalid_input("expected three dot-separated segments"));
        auto second = token.find('.', first + 1);
        if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos)
            return std::unexpected(TiergateError::invalid_input("expected three dot-separated segments"));

        std::string header_seg(token.substr(0, first));
        std::string payload_seg(token.substr(first + 1, second - first - 1));
        std::string signature_seg(token.substr(second + 1));
        if (header_seg.empty() || payload_seg.empty())
            return std::unexpected(TiergateError::invalid_input("empty token segment"));

        DecodedToken decoded;

        auto header = decode_json_segment(header_seg, "header");
        if (!header)
            return std::unexpected(header.error());
        decoded.header = std::move(*header);

        auto payload = decode_json_segment(payload_seg, "payload");
        if (!payload)
            return std::unexpected(payload.error());
        decoded.payload = std::move(*payload);

        auto signature = crypto::Base64::decode_url_safe(signature_seg);
        if (!signature)
            return std::unexpected(TiergateError::invalid_input("signature is not valid base64url"));
        decoded.signature = std::move(*signature);

        decoded.signing_input = std::string(token.substr(0, second));
        return decoded;
    }

    // ============================================================================
    // TokenValidator
    // ============================================================================

    TokenValidator::TokenValidator(TokenValidatorConfig cfg) : cfg_(std::move(cfg)) {}

    Result<void> TokenValidator::verify_signature(SignatureAlgorithm alg, const DecodedToken &decoded) const
    {
        crypto::Bytes message = crypto::to_bytes(decoded.signing_input);

        switch (alg)
        {
        case SignatureAlgorithm::EdDSA:
        {
            if (!cfg_.public_key)
                return std::unexpected(TiergateError::config("No public key configured for EdDSA signature verification"));
            if (decoded.signature.size() != 64)
                return std::unexpected(TiergateError::license("Invalid signature length"));

            crypto::Ed25519Signature sig{};
            std::copy(decoded.signature.begin(), decoded.signature.end(), sig.begin());
            if (!crypto::Ed25519KeyPair::verify(message, sig, *cfg_.public_key))
                return std::unexpected(TiergateError::license("Invalid signature - license may be tampered"));
            return {};
        }
        case SignatureAlgorithm::HS256:
        {
            // Development-only mode; a shared secret must never gate production licenses.
            if (!cfg_.allow_symmetric)
            {
                return std::unexpected(TiergateError::config(
                    "HS256 signature rejected: symmetric signing is development-only and not enabled"));
            }
            if (cfg_.secret_key.empty())
                return std::unexpected(TiergateError::config("HS256 signature requires a development secret key"));
            if (!crypto::HmacSha256::verify(cfg_.secret_key, message, decoded.signature))
                return std::unexpected(TiergateError::license("Invalid signature - license may be tampered"));
            return {};
        }
        }
        return std::unexpected(TiergateError::license("Unsupported signature algorithm"));
    }

    Result<void> TokenValidator::verify_registered_claims(const LicenseClaims &claims) const
    {
        if (!cfg_.issuer.empty() && claims.issuer != cfg_.issuer)
            return std::unexpected(TiergateError::license("Invalid issuer"));

        if (!cfg_.audience.empty() &&
            std::find(claims.audience.begin(), claims.audience.end(), cfg_.audience) == claims.audience.end())
        {
            return std::unexpected(TiergateError::license("Invalid audience"));
        }
        return {};
    }

    ValidationResult TokenValidator::validate_token(
        std::string_view raw_token,
        std::chrono::system_clock::time_point now) const
    {
        auto token = trim(raw_token);
        if (token.empty())
            return ValidationResult::invalid("License token is empty");

        auto decoded = DecodedToken::decode(token);
        if (!decoded)
            return ValidationResult::invalid(std::format("Invalid token format: {}", decoded.error().what()));

        SignatureAlgorithm alg = SignatureAlgorithm::EdDSA;
        if (auto it = decoded->header.find("alg"); it != decoded->header.end())
        {
            if (!it->is_string())
                return ValidationResult::invalid("Unsupported token algorithm");
            auto parsed = algorithm_from_name(it->get<std::string>());
            if (!parsed)
                return ValidationResult::invalid(std::format("Unsupported token algorithm: {}", it->get<std::string>()));
            alg = *parsed;
        }

        if (auto sig = verify_signature(alg, *decoded); !sig)
            return ValidationResult::invalid(sig.error().what());

        auto claims = LicenseClaims::from_json(decoded->payload);
        if (!claims)
            return ValidationResult::invalid(std::format("Invalid token: {}", claims.error().what()));

        if (auto reg = verify_registered_claims(*claims); !reg)
            return ValidationResult::invalid(reg.error().what());

        const int64_t now_s = to_epoch_seconds(now);

        if (claims->not_before && now_s < *claims->not_before)
            return ValidationResult::invalid("License not yet valid");

        ValidationResult result;
        result.claims = *claims;

        if (now_s >= claims->expires_at)
        {
            // Grace only shapes messaging; the result stays invalid.
            const int64_t elapsed = now_s - claims->expires_at;
            const int64_t days_since_expiry = (elapsed + kSecondsPerDay - 1) / kSecondsPerDay;

            copy_entitlements(*claims, result);
            result.is_valid = false;
            result.is_expired = true;
            result.is_in_grace_period = days_since_expiry > 0 && days_since_expiry <= cfg_.grace_days;
            result.days_until_expiration = -days_since_expiry;
            result.error_message = std::format("License expired {} days ago", days_since_expiry);
            return result;
        }

        copy_entitlements(*claims, result);
        result.is_valid = true;
        result.days_until_expiration = floor_div(claims->expires_at - now_s, kSecondsPerDay);
        return result;
    }

} // namespace tiergate
