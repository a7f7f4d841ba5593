#pragma once

#include "types.hpp"
#include "entitlements.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tiergate
{

    struct HttpUrl
    {
        std::string scheme; // "http" or "https"
        std::string host;
        std::uint16_t port{0};
        std::string target{"/"};

        /** Only http and https are accepted; anything else is UntrustedVerifier. */
        static Result<HttpUrl> parse(std::string_view url);

        bool is_loopback() const;

        /** host[:port] as sent in the Host header; IPv6 literals are bracketed, default ports omitted. */
        std::string authority() const;
        std::string origin() const; // scheme://authority
    };

    struct HttpResponse
    {
        unsigned status{0};
        std::string body;
    };

    /**
     * Network seam for the verifier client. Implementations report transport
     * failures (resolve, connect, TLS, timeout) as NetworkError.
     */
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual Result<HttpResponse> post(
            const HttpUrl &url,
            const std::map<std::string, std::string> &headers,
            const std::string &body,
            std::chrono::milliseconds timeout) = 0;
    };

    /**
     * Boost.Beast transport; TLS via Boost.Asio SSL for https.
     * The timeout bounds connect, handshake and I/O. Address literals skip name
     * resolution; for DNS names a stalled system resolver can hold post() past the
     * timeout, since Asio joins its resolver thread on shutdown.
     */
    class BeastHttpTransport : public HttpTransport
    {
    public:
        BeastHttpTransport();
        ~BeastHttpTransport() override;

        Result<HttpResponse> post(
            const HttpUrl &url,
            const std::map<std::string, std::string> &headers,
            const std::string &body,
            std::chrono::milliseconds timeout) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    /** Fixed allow-list of verifier origins. Loopback hosts are accepted on any port. */
    const std::vector<std::string> &trusted_verifier_urls();

    /**
     * Normalize (strip trailing '/') and vet a configured verifier base URL.
     * Fails with UntrustedVerifier for foreign hosts or non-HTTP(S) schemes.
     */
    Result<std::string> vet_verifier_base_url(std::string_view raw);

    struct RemoteVerifierConfig
    {
        std::string base_url;
        std::chrono::milliseconds timeout{2000};
        int retries{2};
        std::chrono::milliseconds backoff_step{50};
    };

    /**
     * Client for POST {base}/verify. Each call makes at most retries+1 attempts
     * and never returns a default-valid record on failure.
     */
    class RemoteVerifier
    {
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        RemoteVerifier(Passkey, RemoteVerifierConfig cfg, HttpUrl endpoint, std::shared_ptr<HttpTransport> transport);

        /** Validates the base URL before any network use. */
        static Result<std::shared_ptr<RemoteVerifier>> create(
            RemoteVerifierConfig cfg,
            std::shared_ptr<HttpTransport> transport = std::make_shared<BeastHttpTransport>());

        /**
         * Verify a token. Errors are NetworkError, ProtocolError or
         * UntrustedVerifier and never contain the token.
         */
        Result<VerifiedEntitlements> verify(
            std::string_view token,
            const std::optional<std::string> &environment) const;

        /** Parse a verifier response body, accepting both field-name conventions. */
        static Result<VerifiedEntitlements> parse_response(const std::string &body);

        const RemoteVerifierConfig &config() const { return cfg_; }

    private:
        Result<VerifiedEntitlements> attempt(const std::string &body) const;

        RemoteVerifierConfig cfg_;
        HttpUrl endpoint_;
        std::shared_ptr<HttpTransport> transport_;
    };

    /** Hex SHA-256 of the trimmed token; the only form in which tokens are referenced. */
    std::string token_hash(std::string_view token);

} // namespace tiergate
