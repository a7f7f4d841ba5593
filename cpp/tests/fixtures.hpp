#pragma once

#include "tiergate/clock.hpp"
#include "tiergate/crypto.hpp"
#include "tiergate/remote_verifier.hpp"
#include "tiergate/token_codec.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace tiergate::testing
{
    using namespace std::chrono_literals;

    constexpr int64_t kDay = 24 * 60 * 60;

    /** Clock advanced by hand; wall and monotonic time move together. */
    class ManualClock : public Clock
    {
    public:
        explicit ManualClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::time_point(std::chrono::seconds(1'800'000'000)))
            : wall_(start), steady_(std::chrono::steady_clock::time_point(std::chrono::hours(1000)))
        {
        }

        std::chrono::system_clock::time_point now() const override
        {
            std::lock_guard lock(mutex_);
            return wall_;
        }

        std::chrono::steady_clock::time_point steady_now() const override
        {
            std::lock_guard lock(mutex_);
            return steady_;
        }

        void advance(std::chrono::seconds by)
        {
            std::lock_guard lock(mutex_);
            wall_ += by;
            steady_ += by;
        }

        int64_t epoch() const
        {
            return std::chrono::duration_cast<std::chrono::seconds>(now().time_since_epoch()).count();
        }

    private:
        mutable std::mutex mutex_;
        std::chrono::system_clock::time_point wall_;
        std::chrono::steady_clock::time_point steady_;
    };

    /** Signs license tokens the way the offline generator does. */
    class TokenFactory
    {
    public:
        TokenFactory() : keypair_(crypto::Ed25519KeyPair::generate().value()) {}

        nlohmann::json claims(int64_t now, const std::string &tier = "pro") const
        {
            return nlohmann::json{
                {"iss", "tiergate-licensing"},
                {"aud", "tiergate"},
                {"sub", "cust-42"},
                {"jti", "lic-0001"},
                {"tier", tier},
                {"features", {"advanced_graph", "policy_engine"}},
                {"organization", "Acme Corp"},
                {"seats", 25},
                {"iat", now - kDay},
                {"exp", now + 365 * kDay}};
        }

        std::string sign(const nlohmann::json &payload, const std::string &alg = "EdDSA",
                         const std::string &hmac_secret = "dev-secret") const
        {
            nlohmann::json header{{"alg", alg}, {"typ", "JWT"}};
            std::string input = segment(header.dump()) + "." + segment(payload.dump());
            crypto::Bytes message = crypto::to_bytes(input);

            crypto::Bytes sig;
            if (alg == "HS256")
            {
                auto tag = crypto::HmacSha256::compute(hmac_secret, message);
                sig.assign(tag.begin(), tag.end());
            }
            else if (alg == "EdDSA")
            {
                auto s = keypair_.sign(message);
                sig.assign(s.begin(), s.end());
            }
            return input + "." + crypto::Base64::encode_url_safe(sig);
        }

        std::string make(int64_t now, const std::string &tier = "pro") const
        {
            return sign(claims(now, tier));
        }

        TokenValidatorConfig validator_config() const
        {
            TokenValidatorConfig cfg;
            cfg.public_key = keypair_.public_key;
            return cfg;
        }

        std::string public_key_b64() const
        {
            return crypto::Base64::encode(crypto::Bytes(keypair_.public_key.begin(), keypair_.public_key.end()));
        }

        static std::string segment(const std::string &raw)
        {
            return crypto::Base64::encode_url_safe(crypto::to_bytes(raw));
        }

    private:
        crypto::Ed25519KeyPair keypair_;
    };

    /** Counts cryptographic validations passing through to a real validator. */
    class CountingVerifier : public TokenVerifier
    {
    public:
        explicit CountingVerifier(TokenValidatorConfig cfg) : inner_(std::move(cfg)) {}

        ValidationResult validate_token(std::string_view token,
                                        std::chrono::system_clock::time_point now) const override
        {
            calls_.fetch_add(1);
            return inner_.validate_token(token, now);
        }

        int calls() const { return calls_.load(); }

    private:
        TokenValidator inner_;
        mutable std::atomic<int> calls_{0};
    };

    /** Scripted verifier endpoint. Unscripted calls fall back to `fallback`. */
    class FakeTransport : public HttpTransport
    {
    public:
        Result<HttpResponse> post(const HttpUrl &url,
                                  const std::map<std::string, std::string> &headers,
                                  const std::string &body,
                                  std::chrono::milliseconds) override
        {
            std::lock_guard lock(mutex_);
            ++calls_;
            last_url_ = url;
            last_headers_ = headers;
            last_body_ = body;
            if (!scripted_.empty())
            {
                auto next = scripted_.front();
                scripted_.pop_front();
                return next;
            }
            return fallback_;
        }

        void push(Result<HttpResponse> response)
        {
            std::lock_guard lock(mutex_);
            scripted_.push_back(std::move(response));
        }

        void set_fallback(Result<HttpResponse> response)
        {
            std::lock_guard lock(mutex_);
            fallback_ = std::move(response);
        }

        void go_offline()
        {
            set_fallback(std::unexpected(TiergateError::network("connect failed: Connection refused")));
        }

        int calls() const
        {
            std::lock_guard lock(mutex_);
            return calls_;
        }

        HttpUrl last_url() const
        {
            std::lock_guard lock(mutex_);
            return last_url_;
        }

        std::map<std::string, std::string> last_headers() const
        {
            std::lock_guard lock(mutex_);
            return last_headers_;
        }

        std::string last_body() const
        {
            std::lock_guard lock(mutex_);
            return last_body_;
        }

    private:
        mutable std::mutex mutex_;
        std::deque<Result<HttpResponse>> scripted_;
        Result<HttpResponse> fallback_{std::unexpected(TiergateError::network("no scripted response"))};
        int calls_{0};
        HttpUrl last_url_;
        std::map<std::string, std::string> last_headers_;
        std::string last_body_;
    };

    inline HttpResponse verifier_ok(bool valid, const std::string &tier, int64_t exp,
                                    std::optional<std::string> error = std::nullopt)
    {
        nlohmann::json body{
            {"valid", valid},
            {"error", error ? nlohmann::json(*error) : nlohmann::json(nullptr)},
            {"license", {{"exp", exp},
                         {"tier", tier},
                         {"features", {"advanced_graph"}},
                         {"customer_id", "cust-42"},
                         {"organization", "Acme Corp"},
                         {"seats", 25}}}};
        return HttpResponse{200, body.dump()};
    }

    /** Unique scratch directory removed on destruction. */
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                    ("tiergate-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

        std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    inline void write_text(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_text(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    /** Sets (or unsets, with nullopt) an environment variable for the scope. */
    class EnvGuard
    {
    public:
        EnvGuard(std::string name, std::optional<std::string> value) : name_(std::move(name))
        {
            if (const char *prev = std::getenv(name_.c_str()))
                previous_ = prev;
            if (value)
                ::setenv(name_.c_str(), value->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        ~EnvGuard()
        {
            if (previous_)
                ::setenv(name_.c_str(), previous_->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        EnvGuard(const EnvGuard &) = delete;
        EnvGuard &operator=(const EnvGuard &) = delete;

    private:
        std::string name_;
        std::optional<std::string> previous_;
    };

} // namespace tiergate::testing
