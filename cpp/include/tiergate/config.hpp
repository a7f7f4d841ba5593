#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace tiergate
{
    /** $XDG_CONFIG_HOME/tiergate/license_cache.json, else ~/.config/tiergate/license_cache.json */
    std::filesystem::path default_cache_path();

    struct VerifierSettings
    {
        std::optional<std::string> base_url; // unset => local validation only
        std::optional<std::string> environment;
        double timeout_seconds{2.0};
        int retries{2};

        /** timeout_seconds clamped to [0.1s, 60s]; NaN yields the 2s default. */
        std::chrono::milliseconds timeout() const;
    };

    struct CacheSettings
    {
        std::filesystem::path path{default_cache_path()};
    };

    struct LicenseSettings
    {
        std::optional<std::filesystem::path> path;
        std::optional<std::string> key; // inline token
        std::string public_key;         // base64 Ed25519, defaults to the embedded key
        std::string secret_key;         // HS256, development only
        bool allow_symmetric{false};
        std::string issuer{"tiergate-licensing"};
        std::string audience{"tiergate"};
    };

    struct StartupSettings
    {
        std::optional<std::string> tier;
        bool tier_unification_override{false};
    };

    struct LogSettings
    {
        std::string level{"warning"};
    };

    struct TiergateConfig
    {
        VerifierSettings verifier{};
        CacheSettings cache{};
        LicenseSettings license{};
        StartupSettings startup{};
        LogSettings log{};
    };

    /**
     * ConfigLoader loads TOML configs with TIERGATE_* environment overrides.
     * A configured verifier URL is vetted against the allow-list before the
     * config is returned, so an untrusted verifier never reaches the engine.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<TiergateConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<TiergateConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides. */
        static Result<TiergateConfig> from_env();

        /** Serialize config to JSON for inspection; secrets are reported by presence only. */
        static nlohmann::json to_json(const TiergateConfig &cfg);

    private:
        static TiergateConfig defaults();
        static void apply_env_overrides(TiergateConfig &cfg);
        static Result<TiergateConfig> finalize(TiergateConfig cfg);
    };

} // namespace tiergate
