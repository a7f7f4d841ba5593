#include "tiergate/config.hpp"
#include "tiergate/logging.hpp"
#include "tiergate/remote_verifier.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

#ifndef TIERGATE_EMBEDDED_PUBLIC_KEY
#define TIERGATE_EMBEDDED_PUBLIC_KEY ""
#endif

namespace tiergate
{
    namespace
    {
        constexpr double kMinTimeoutSeconds = 0.1;
        constexpr double kMaxTimeoutSeconds = 60.0;
        constexpr double kDefaultTimeoutSeconds = 2.0;
        constexpr int kDefaultRetries = 2;

        std::optional<std::string> env(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value || !*value)
                return std::nullopt;
            return std::string(value);
        }

        bool truthy(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value == "1" || value == "true" || value == "yes" || value == "on";
        }

        double sanitize_timeout(double seconds)
        {
            if (std::isnan(seconds))
                return kDefaultTimeoutSeconds;
            return std::clamp(seconds, kMinTimeoutSeconds, kMaxTimeoutSeconds);
        }

        int sanitize_retries(int64_t retries)
        {
            return static_cast<int>(std::clamp<int64_t>(retries, 0, 100));
        }

        std::optional<double> parse_double(const std::string &s)
        {
            double value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc() || ptr != s.data() + s.size())
                return std::nullopt;
            return value;
        }

        std::optional<int64_t> parse_int(const std::string &s)
        {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
            if (ec != std::errc() || ptr != s.data() + s.size())
                return std::nullopt;
            return value;
        }

        TiergateConfig parse_toml(const toml::table &tbl, TiergateConfig cfg)
        {
            if (auto verifier = tbl["verifier"].as_table())
            {
                if (auto url = (*verifier)["base_url"].value<std::string>())
                    cfg.verifier.base_url = *url;
                if (auto environment = (*verifier)["environment"].value<std::string>())
                    cfg.verifier.environment = *environment;
                // value<double> also converts TOML integers
                if (auto timeout = (*verifier)["timeout_seconds"].value<double>())
                    cfg.verifier.timeout_seconds = sanitize_timeout(*timeout);
                if (auto retries = (*verifier)["retries"].value<int64_t>())
                    cfg.verifier.retries = sanitize_retries(*retries);
            }

            if (auto cache = tbl["cache"].as_table())
            {
                if (auto path = (*cache)["path"].value<std::string>())
                    cfg.cache.path = *path;
            }

            if (auto license = tbl["license"].as_table())
            {
                if (auto path = (*license)["path"].value<std::string>())
                    cfg.license.path = std::filesystem::path(*path);
                if (auto key = (*license)["key"].value<std::string>())
                    cfg.license.key = *key;
                if (auto pk = (*license)["public_key"].value<std::string>())
                    cfg.license.public_key = *pk;
                if (auto sk = (*license)["secret_key"].value<std::string>())
                    cfg.license.secret_key = *sk;
                if (auto allow = (*license)["allow_symmetric"].value<bool>())
                    cfg.license.allow_symmetric = *allow;
                if (auto issuer = (*license)["issuer"].value<std::string>())
                    cfg.license.issuer = *issuer;
                if (auto audience = (*license)["audience"].value<std::string>())
                    cfg.license.audience = *audience;
            }

            if (auto startup = tbl["startup"].as_table())
            {
                if (auto tier = (*startup)["tier"].value<std::string>())
                    cfg.startup.tier = *tier;
                if (auto override_flag = (*startup)["tier_unification_override"].value<bool>())
                    cfg.startup.tier_unification_override = *override_flag;
            }

            if (auto log = tbl["log"].as_table())
            {
                if (auto level = (*log)["level"].value<std::string>())
                    cfg.log.level = *level;
            }

            return cfg;
        }

    } // namespace

    std::chrono::milliseconds VerifierSettings::timeout() const
    {
        return std::chrono::milliseconds(static_cast<int64_t>(sanitize_timeout(timeout_seconds) * 1000.0));
    }

    std::filesystem::path default_cache_path()
    {
        if (auto xdg = env("XDG_CONFIG_HOME"))
            return std::filesystem::path(*xdg) / "tiergate" / "license_cache.json";
        if (auto home = env("HOME"))
            return std::filesystem::path(*home) / ".config" / "tiergate" / "license_cache.json";
        return std::filesystem::path(".tiergate") / "license_cache.json";
    }

    TiergateConfig ConfigLoader::defaults()
    {
        TiergateConfig cfg{};
        cfg.license.public_key = TIERGATE_EMBEDDED_PUBLIC_KEY;
        return cfg;
    }

    Result<TiergateConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(TiergateError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<TiergateConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        TiergateConfig cfg = defaults();

        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl, cfg);
        }
        catch (const std::exception &e)
        {
            return std::unexpected(TiergateError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        apply_env_overrides(cfg);
        return finalize(std::move(cfg));
    }

    Result<TiergateConfig> ConfigLoader::from_env()
    {
        TiergateConfig cfg = defaults();
        apply_env_overrides(cfg);
        return finalize(std::move(cfg));
    }

    void ConfigLoader::apply_env_overrides(TiergateConfig &cfg)
    {
        if (auto url = env("TIERGATE_LICENSE_VERIFIER_URL"))
            cfg.verifier.base_url = *url;
        if (auto environment = env("TIERGATE_LICENSE_ENVIRONMENT"))
            cfg.verifier.environment = *environment;
        if (auto timeout = env("TIERGATE_LICENSE_VERIFY_TIMEOUT_SECONDS"))
        {
            auto parsed = parse_double(*timeout);
            if (!parsed)
                logging::get()->warn("Ignoring unparsable TIERGATE_LICENSE_VERIFY_TIMEOUT_SECONDS; using {}s",
                                     kDefaultTimeoutSeconds);
            cfg.verifier.timeout_seconds = sanitize_timeout(parsed.value_or(kDefaultTimeoutSeconds));
        }
        if (auto retries = env("TIERGATE_LICENSE_VERIFY_RETRIES"))
        {
            auto parsed = parse_int(*retries);
            if (!parsed)
                logging::get()->warn("Ignoring unparsable TIERGATE_LICENSE_VERIFY_RETRIES; using {}", kDefaultRetries);
            cfg.verifier.retries = sanitize_retries(parsed.value_or(kDefaultRetries));
        }

        if (auto path = env("TIERGATE_LICENSE_CACHE_PATH"))
            cfg.cache.path = *path;

        if (auto path = env("TIERGATE_LICENSE_PATH"))
            cfg.license.path = std::filesystem::path(*path);
        if (auto key = env("TIERGATE_LICENSE_KEY"))
            cfg.license.key = *key;
        if (auto pk = env("TIERGATE_LICENSE_PUBLIC_KEY"))
            cfg.license.public_key = *pk;
        if (auto sk = env("TIERGATE_SECRET_KEY"))
            cfg.license.secret_key = *sk;
        if (auto allow = env("TIERGATE_ALLOW_HS256"))
            cfg.license.allow_symmetric = truthy(*allow);

        if (auto tier = env("TIERGATE_TIER"))
            cfg.startup.tier = *tier;
        if (auto override_flag = env("TIERGATE_TIER_UNIFICATION_OVERRIDE"))
            cfg.startup.tier_unification_override = truthy(*override_flag);

        if (auto level = env("TIERGATE_LOG_LEVEL"))
            cfg.log.level = *level;
    }

    Result<TiergateConfig> ConfigLoader::finalize(TiergateConfig cfg)
    {
        if (cfg.verifier.base_url && cfg.verifier.base_url->empty())
            cfg.verifier.base_url.reset();

        if (cfg.verifier.base_url)
        {
            auto vetted = vet_verifier_base_url(*cfg.verifier.base_url);
            if (!vetted)
                return std::unexpected(vetted.error());
            cfg.verifier.base_url = *vetted;
        }

        if (auto level = logging::parse_level(cfg.log.level); !level)
        {
            return std::unexpected(TiergateError::config(level.error().what()));
        }

        if (cfg.startup.tier && !parse_tier_alias(*cfg.startup.tier))
        {
            return std::unexpected(TiergateError::config("Invalid startup tier: " + *cfg.startup.tier));
        }

        return cfg;
    }

    nlohmann::json ConfigLoader::to_json(const TiergateConfig &cfg)
    {
        auto opt = [](const auto &v) -> nlohmann::json {
            if (v)
                return *v;
            return nullptr;
        };

        nlohmann::json j;
        j["verifier"] = {
            {"base_url", opt(cfg.verifier.base_url)},
            {"environment", opt(cfg.verifier.environment)},
            {"timeout_seconds", cfg.verifier.timeout_seconds},
            {"retries", cfg.verifier.retries}};
        j["cache"] = {{"path", cfg.cache.path.string()}};
        j["license"] = {
            {"path", cfg.license.path ? nlohmann::json(cfg.license.path->string()) : nlohmann::json(nullptr)},
            {"has_inline_key", cfg.license.key.has_value()},
            {"has_public_key", !cfg.license.public_key.empty()},
            {"has_secret_key", !cfg.license.secret_key.empty()},
            {"allow_symmetric", cfg.license.allow_symmetric},
            {"issuer", cfg.license.issuer},
            {"audience", cfg.license.audience}};
        j["startup"] = {
            {"tier", opt(cfg.startup.tier)},
            {"tier_unification_override", cfg.startup.tier_unification_override}};
        j["log"] = {{"level", cfg.log.level}};
        return j;
    }

} // namespace tiergate
