#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "token_codec.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tiergate
{
    /** Well-known license locations, project-relative first. "~" is expanded from $HOME. */
    std::vector<std::filesystem::path> default_license_search_paths();

    struct LicenseEvaluatorConfig
    {
        std::optional<std::filesystem::path> license_path; // explicit override
        std::optional<std::string> inline_token;           // license.key / TIERGATE_LICENSE_KEY
        std::vector<std::filesystem::path> search_paths = default_license_search_paths();
        std::chrono::hours revalidation_ttl{24};
    };

    /** A license token together with where it came from. */
    struct LicenseSource
    {
        std::string token;
        std::string origin; // file path, or "inline"
    };

    /**
     * Local license evaluation: discovery, signature/claims validation through
     * a TokenVerifier, and an in-process revalidation cache keyed by the
     * content fingerprint of the license. A cached result is served only
     * while the fingerprint is unchanged and the TTL (monotonic clock) has
     * not elapsed.
     */
    class LicenseEvaluator
    {
    public:
        LicenseEvaluator(LicenseEvaluatorConfig cfg,
                         std::shared_ptr<const TokenVerifier> verifier,
                         std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

        /** Explicit path if configured, else the first existing search path. */
        std::optional<std::filesystem::path> find_license_file() const;

        /**
         * Load the current token. Empty optional when no license is present;
         * an error when the configured explicit path cannot be read.
         */
        Result<std::optional<LicenseSource>> load_license_token() const;

        /** Validate the current license; no license is a valid community result. */
        ValidationResult validate();

        /** Licensed tier, or community when the license is absent, invalid or expired. */
        Tier get_current_tier();

        /** Report of the current license suitable for display. */
        nlohmann::json license_info();

        /** Drop the revalidation cache. */
        void invalidate();

        const LicenseEvaluatorConfig &config() const { return cfg_; }

    private:
        struct CachedValidation
        {
            std::string fingerprint;
            std::chrono::steady_clock::time_point validated_at;
            ValidationResult result;
        };

        LicenseEvaluatorConfig cfg_;
        std::shared_ptr<const TokenVerifier> verifier_;
        std::shared_ptr<const Clock> clock_;

        std::mutex mutex_;
        std::optional<CachedValidation> cached_;
    };

} // namespace tiergate
