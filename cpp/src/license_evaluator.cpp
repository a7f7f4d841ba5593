#include "tiergate/license_evaluator.hpp"
#include "tiergate/crypto.hpp"
#include "tiergate/logging.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace tiergate
{
    namespace
    {
        std::string trim(const std::string &s)
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }

        Result<std::string> read_file(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                return std::unexpected(TiergateError::license("Failed to open license file: " + path.string()));
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            if (file.bad())
            {
                return std::unexpected(TiergateError::license("Failed to read license file: " + path.string()));
            }
            return buffer.str();
        }

        std::string fingerprint_of(const LicenseSource &source)
        {
            return source.origin + "|" + crypto::SHA256::hex_digest(source.token);
        }

        /** Whether a cached result is still what a fresh validation at `now` would return. */
        bool still_current(const ValidationResult &result, std::chrono::system_clock::time_point now)
        {
            if (!result.claims)
                return true; // structural failure or no license; time cannot change it
            if (!result.is_valid)
                return false;
            const auto now_s = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
            return now_s < result.claims->expires_at;
        }

        bool is_regular_file(const std::filesystem::path &path)
        {
            std::error_code ec;
            return std::filesystem::is_regular_file(path, ec);
        }
    } // namespace

    std::vector<std::filesystem::path> default_license_search_paths()
    {
        std::vector<std::filesystem::path> paths{".tiergate-license"};
        if (const char *home = std::getenv("HOME"); home && *home)
        {
            paths.push_back(std::filesystem::path(home) / ".config" / "tiergate" / "license");
        }
        paths.emplace_back("/etc/tiergate/license");
        return paths;
    }

    LicenseEvaluator::LicenseEvaluator(LicenseEvaluatorConfig cfg,
                                       std::shared_ptr<const TokenVerifier> verifier,
                                       std::shared_ptr<const Clock> clock)
        : cfg_(std::move(cfg)), verifier_(std::move(verifier)), clock_(std::move(clock))
    {
    }

    std::optional<std::filesystem::path> LicenseEvaluator::find_license_file() const
    {
        if (cfg_.license_path)
        {
            return cfg_.license_path;
        }
        for (const auto &candidate : cfg_.search_paths)
        {
            if (is_regular_file(candidate))
            {
                logging::get()->debug("Found license file: {}", candidate.string());
                return candidate;
            }
        }
        logging::get()->debug("No license file found in standard locations");
        return std::nullopt;
    }

    Result<std::optional<LicenseSource>> LicenseEvaluator::load_license_token() const
    {
        // Explicit path outranks the inline key; both outrank discovery.
        if (cfg_.license_path)
        {
            auto content = read_file(*cfg_.license_path);
            if (!content)
            {
                logging::get()->error("{}", content.error().what());
                return std::unexpected(content.error());
            }
            auto token = trim(*content);
            if (token.empty())
                return std::optional<LicenseSource>{};
            return std::optional<LicenseSource>{LicenseSource{std::move(token), cfg_.license_path->string()}};
        }

        if (cfg_.inline_token)
        {
            auto token = trim(*cfg_.inline_token);
            if (!token.empty())
            {
                logging::get()->debug("Loaded license from inline key");
                return std::optional<LicenseSource>{LicenseSource{std::move(token), "inline"}};
            }
        }

        auto path = find_license_file();
        if (!path)
            return std::optional<LicenseSource>{};

        auto content = read_file(*path);
        if (!content)
        {
            logging::get()->error("{}", content.error().what());
            return std::unexpected(content.error());
        }
        auto token = trim(*content);
        if (token.empty())
            return std::optional<LicenseSource>{};
        logging::get()->debug("Loaded license from file: {}", path->string());
        return std::optional<LicenseSource>{LicenseSource{std::move(token), path->string()}};
    }

    ValidationResult LicenseEvaluator::validate()
    {
        auto source = load_license_token();
        if (!source)
        {
            return ValidationResult::invalid(source.error().what());
        }
        if (!*source)
        {
            return ValidationResult::community();
        }

        const auto fingerprint = fingerprint_of(**source);
        const auto steady_now = clock_->steady_now();
        const auto now = clock_->now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cached_ && cached_->fingerprint == fingerprint &&
                steady_now - cached_->validated_at < cfg_.revalidation_ttl &&
                still_current(cached_->result, now))
            {
                return cached_->result;
            }
        }

        auto result = verifier_->validate_token((*source)->token, now);

        std::lock_guard<std::mutex> lock(mutex_);
        cached_ = CachedValidation{fingerprint, steady_now, result};
        return result;
    }

    Tier LicenseEvaluator::get_current_tier()
    {
        const auto result = validate();

        if (result.is_valid)
        {
            return result.tier;
        }

        if (result.is_expired && result.is_in_grace_period)
        {
            const auto days = result.days_until_expiration ? -*result.days_until_expiration : 0;
            logging::get()->warn("License expired {} days ago - grace period active, running as community", days);
            return Tier::Community;
        }

        logging::get()->info("Defaulting to community tier: {}", result.error_message.value_or("no license"));
        return Tier::Community;
    }

    nlohmann::json LicenseEvaluator::license_info()
    {
        return validate().to_json();
    }

    void LicenseEvaluator::invalidate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_.reset();
    }

} // namespace tiergate
