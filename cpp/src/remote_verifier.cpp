#include "tiergate/remote_verifier.hpp"
#include "tiergate/crypto.hpp"
#include "tiergate/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>
#include <thread>

namespace tiergate
{

    namespace
    {
        std::string lower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string_view trim(std::string_view s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        bool truthy(const nlohmann::json &v)
        {
            if (v.is_boolean())
                return v.get<bool>();
            if (v.is_number())
                return v.get<double>() != 0.0;
            if (v.is_string())
                return !v.get<std::string>().empty();
            if (v.is_array() || v.is_object())
                return !v.empty();
            return false;
        }

        std::optional<int64_t> to_int(const nlohmann::json &v)
        {
            if (v.is_number_unsigned())
            {
                const auto u = v.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max()))
                    return std::nullopt;
                return static_cast<int64_t>(u);
            }
            if (v.is_number_integer())
                return v.get<int64_t>();
            if (v.is_number_float())
                return checked_int64(v.get<double>());
            if (v.is_string())
            {
                auto s = trim(v.get_ref<const std::string &>());
                int64_t out = 0;
                auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
                if (ec == std::errc{} && ptr == s.data() + s.size())
                    return out;
            }
            return std::nullopt;
        }

        std::optional<std::string> first_string(const nlohmann::json &obj, const char *primary, const char *alias)
        {
            if (auto it = obj.find(primary); it != obj.end() && it->is_string())
                return it->get<std::string>();
            if (auto it = obj.find(alias); it != obj.end() && it->is_string())
                return it->get<std::string>();
            return std::nullopt;
        }
    } // namespace

    std::string token_hash(std::string_view token)
    {
        return crypto::SHA256::hex_digest(trim(token));
    }

    // ============================================================================
    // HttpUrl
    // ============================================================================

    Result<HttpUrl> HttpUrl::parse(std::string_view url)
    {
        auto sep = url.find("://");
        if (sep == std::string_view::npos)
            return std::unexpected(TiergateError::untrusted_verifier(std::format("Unsupported verifier URL: {}", url)));

        HttpUrl out;
        out.scheme = lower(url.substr(0, sep));
        if (out.scheme != "http" && out.scheme != "https")
        {
            return std::unexpected(TiergateError::untrusted_verifier(
                std::format("Unsupported verifier scheme: {}", out.scheme)));
        }

        auto rest = url.substr(sep + 3);
        auto path_pos = rest.find_first_of("/?#");
        auto authority = rest.substr(0, path_pos);
        if (path_pos != std::string_view::npos)
        {
            if (rest[path_pos] != '/')
                return std::unexpected(TiergateError::untrusted_verifier("Verifier URL may not carry a query or fragment"));
            out.target = std::string(rest.substr(path_pos));
        }

        if (authority.empty())
            return std::unexpected(TiergateError::untrusted_verifier("Verifier URL has no host"));
        if (authority.find('@') != std::string_view::npos)
            return std::unexpected(TiergateError::untrusted_verifier("Verifier URL may not carry credentials"));

        std::string_view host;
        std::string_view port;
        if (authority.front() == '[')
        {
            auto close = authority.find(']');
            if (close == std::string_view::npos)
                return std::unexpected(TiergateError::untrusted_verifier("Malformed IPv6 verifier host"));
            host = authority.substr(1, close - 1);
            auto after = authority.substr(close + 1);
            if (!after.empty())
            {
                if (after.front() != ':')
                    return std::unexpected(TiergateError::untrusted_verifier("Malformed verifier authority"));
                port = after.substr(1);
            }
        }
        else
        {
            auto colon = authority.rfind(':');
            host = authority.substr(0, colon);
            if (colon != std::string_view::npos)
                port = authority.substr(colon + 1);
        }

        if (host.empty())
            return std::unexpected(TiergateError::untrusted_verifier("Verifier URL has no host"));
        out.host = lower(host);

        if (port.empty())
        {
            out.port = out.scheme == "https" ? 443 : 80;
        }
        else
        {
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
            if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 || value > 65535)
                return std::unexpected(TiergateError::untrusted_verifier(std::format("Invalid verifier port: {}", port)));
            out.port = static_cast<std::uint16_t>(value);
        }

        return out;
    }

    bool HttpUrl::is_loopback() const
    {
        return host == "localhost" || host == "127.0.0.1" || host == "::1";
    }

    std::string HttpUrl::authority() const
    {
        const bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
        const std::string h = host.find(':') != std::string::npos ? std::format("[{}]", host) : host;
        if (default_port)
            return h;
        return std::format("{}:{}", h, port);
    }

    std::string HttpUrl::origin() const
    {
        return std::format("{}://{}", scheme, authority());
    }

    // ============================================================================
    // Allow-list
    // ============================================================================

    const std::vector<std::string> &trusted_verifier_urls()
    {
        static const std::vector<std::string> urls = {
            "https://verifier.tiergate.dev",
            "http://tiergate-verifier:8000",
            "http://127.0.0.1:8003",
            "http://localhost:8003",
            "http://127.0.0.1:8000",
            "http://localhost:8000",
        };
        return urls;
    }

    Result<std::string> vet_verifier_base_url(std::string_view raw)
    {
        std::string url(trim(raw));
        while (!url.empty() && url.back() == '/')
            url.pop_back();

        auto parsed = HttpUrl::parse(url);
        if (!parsed)
            return std::unexpected(parsed.error());

        const auto &trusted = trusted_verifier_urls();
        if (std::find(trusted.begin(), trusted.end(), url) != trusted.end() || parsed->is_loopback())
            return url;

        logging::get()->error("SECURITY: untrusted verifier URL rejected: {}", url);
        return std::unexpected(TiergateError::untrusted_verifier(
            std::format("Untrusted verifier URL: {}. Only allow-listed or loopback verifiers are accepted", url)));
    }

    // ============================================================================
    // RemoteVerifier
    // ============================================================================

    RemoteVerifier::RemoteVerifier(Passkey, RemoteVerifierConfig cfg, HttpUrl endpoint, std::shared_ptr<HttpTransport> transport)
        : cfg_(std::move(cfg)), endpoint_(std::move(endpoint)), transport_(std::move(transport))
    {
    }

    Result<std::shared_ptr<RemoteVerifier>> RemoteVerifier::create(
        RemoteVerifierConfig cfg,
        std::shared_ptr<HttpTransport> transport)
    {
        auto base = vet_verifier_base_url(cfg.base_url);
        if (!base)
            return std::unexpected(base.error());
        cfg.base_url = *base;

        // The resolved endpoint must still be plain HTTP(S).
        auto endpoint = HttpUrl::parse(cfg.base_url + "/verify");
        if (!endpoint)
            return std::unexpected(endpoint.error());

        if (!transport)
            return std::unexpected(TiergateError::config("Remote verifier requires a transport"));

        cfg.retries = std::max(0, cfg.retries);
        return std::make_shared<RemoteVerifier>(Passkey{}, std::move(cfg), std::move(*endpoint), std::move(transport));
    }

    Result<VerifiedEntitlements> RemoteVerifier::parse_response(const std::string &body)
    {
        nlohmann::json parsed;
        try
        {
            parsed = nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::exception &)
        {
            return std::unexpected(TiergateError::protocol("Verifier response is not valid JSON"));
        }
        if (!parsed.is_object())
            return std::unexpected(TiergateError::protocol("Verifier response is not an object"));

        VerifiedEntitlements ent;
        if (auto it = parsed.find("valid"); it != parsed.end())
            ent.valid = truthy(*it);

        if (auto it = parsed.find("error"); it != parsed.end() && !it->is_null())
            ent.error = it->is_string() ? it->get<std::string>() : it->dump();

        nlohmann::json lic = nlohmann::json::object();
        if (auto it = parsed.find("license"); it != parsed.end() && it->is_object())
            lic = *it;

        if (auto it = lic.find("exp"); it != lic.end())
            ent.exp = to_int(*it).value_or(0);

        if (auto it = lic.find("tier"); it != lic.end() && it->is_string())
            ent.tier = normalize_tier(it->get<std::string>());

        if (auto it = lic.find("features"); it != lic.end() && it->is_array())
        {
            for (const auto &f : *it)
            {
                if (f.is_string())
                    ent.features.push_back(f.get<std::string>());
                else if (f.is_number())
                    ent.features.push_back(f.dump());
            }
        }

        ent.customer_id = first_string(lic, "customer_id", "customer");
        ent.organization = first_string(lic, "organization", "org");

        if (auto it = lic.find("seats"); it != lic.end())
            ent.seats = to_int(*it);

        return ent;
    }

    Result<VerifiedEntitlements> RemoteVerifier::attempt(const std::string &body) const
    {
        static const std::map<std::string, std::string> headers = {
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
            {"User-Agent", "tiergate/remote-verifier"},
        };

        auto response = transport_->post(endpoint_, headers, body, cfg_.timeout);
        if (!response)
            return std::unexpected(response.error());

        if (response->status < 200 || response->status >= 300)
            return std::unexpected(TiergateError::network(std::format("HTTP {}", response->status)));

        return parse_response(response->body);
    }

    Result<VerifiedEntitlements> RemoteVerifier::verify(
        std::string_view raw_token,
        const std::optional<std::string> &environment) const
    {
        const auto token = trim(raw_token);
        const auto hint = logging::hash_hint(token_hash(token));

        nlohmann::json payload;
        payload["token"] = std::string(token);
        payload["environment"] = environment ? nlohmann::json(*environment) : nlohmann::json(nullptr);
        const std::string body = payload.dump();

        std::optional<TiergateError> last;
        for (int attempt_no = 0; attempt_no <= cfg_.retries; ++attempt_no)
        {
            auto result = attempt(body);
            if (result)
                return result;

            last = result.error();
            logging::get()->debug("Remote verify attempt {} failed (hash={}, error={})",
                                  attempt_no + 1, hint, error_code_name(last->code));
            if (attempt_no < cfg_.retries)
                std::this_thread::sleep_for(cfg_.backoff_step * (attempt_no + 1));
        }

        // Never echo the token or request body.
        const ErrorCode code = last ? last->code : ErrorCode::NetworkError;
        logging::get()->warn("Remote verify failed (hash={}, error={})", hint, error_code_name(code));
        return std::unexpected(TiergateError(code,
                                             std::format("Remote verify failed (hash={}, error={})", hint, error_code_name(code))));
    }

} // namespace tiergate
