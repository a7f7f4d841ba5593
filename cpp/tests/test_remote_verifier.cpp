#include <catch2/catch_test_macros.hpp>
#include "tiergate/remote_verifier.hpp"
#include "tiergate/logging.hpp"
#include "fixtures.hpp"

using namespace tiergate;
using namespace tiergate::testing;

namespace
{
    std::shared_ptr<RemoteVerifier> make_verifier(std::shared_ptr<FakeTransport> transport, int retries = 2)
    {
        RemoteVerifierConfig cfg;
        cfg.base_url = "http://127.0.0.1:8003/";
        cfg.retries = retries;
        cfg.backoff_step = std::chrono::milliseconds(1);
        return RemoteVerifier::create(cfg, std::move(transport)).value();
    }
}

TEST_CASE("Verifier URLs parse into origin and target", "[remote]")
{
    auto https = HttpUrl::parse("https://verifier.tiergate.dev/verify").value();
    REQUIRE(https.scheme == "https");
    REQUIRE(https.host == "verifier.tiergate.dev");
    REQUIRE(https.port == 443);
    REQUIRE(https.target == "/verify");
    REQUIRE(https.origin() == "https://verifier.tiergate.dev");

    auto v6 = HttpUrl::parse("http://[::1]:9000").value();
    REQUIRE(v6.host == "::1");
    REQUIRE(v6.port == 9000);
    REQUIRE(v6.is_loopback());
    REQUIRE(v6.origin() == "http://[::1]:9000");

    SECTION("Host header authority")
    {
        REQUIRE(https.authority() == "verifier.tiergate.dev");
        REQUIRE(v6.authority() == "[::1]:9000");
        REQUIRE(HttpUrl::parse("http://[::1]:8003/verify")->authority() == "[::1]:8003");
        REQUIRE(HttpUrl::parse("http://[::1]/verify")->authority() == "[::1]");
        REQUIRE(HttpUrl::parse("http://127.0.0.1:8003/verify")->authority() == "127.0.0.1:8003");
        REQUIRE(HttpUrl::parse("https://localhost:443")->authority() == "localhost");
    }

    for (const char *bad : {"ftp://127.0.0.1/", "file:///etc/passwd", "127.0.0.1:8003", "http://", "http://user@localhost",
                            "http://localhost?x=1", "http://localhost:0", "http://localhost:99999"})
    {
        INFO(bad);
        auto parsed = HttpUrl::parse(bad);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::UntrustedVerifier);
    }
}

TEST_CASE("Verifier base URL must be allow-listed or loopback", "[remote][security]")
{
    REQUIRE(vet_verifier_base_url("https://verifier.tiergate.dev/").value() == "https://verifier.tiergate.dev");
    REQUIRE(vet_verifier_base_url("http://tiergate-verifier:8000").has_value());
    REQUIRE(vet_verifier_base_url("http://localhost:12345").has_value());
    REQUIRE(vet_verifier_base_url("https://127.0.0.1").has_value());

    for (const char *bad : {"https://evil.example.com", "http://verifier.tiergate.dev", "https://verifier.tiergate.dev.evil.io",
                            "http://tiergate-verifier:9000", "gopher://localhost:8003"})
    {
        INFO(bad);
        auto vetted = vet_verifier_base_url(bad);
        REQUIRE_FALSE(vetted.has_value());
        REQUIRE(vetted.error().code == ErrorCode::UntrustedVerifier);
    }
}

TEST_CASE("Untrusted verifier is rejected before any network call", "[remote][security]")
{
    auto transport = std::make_shared<FakeTransport>();
    transport->set_fallback(verifier_ok(true, "enterprise", 4'000'000'000));

    RemoteVerifierConfig cfg;
    cfg.base_url = "https://rubber-stamp.example.net";
    auto created = RemoteVerifier::create(cfg, transport);

    REQUIRE_FALSE(created.has_value());
    REQUIRE(created.error().code == ErrorCode::UntrustedVerifier);
    REQUIRE(transport->calls() == 0);
}

TEST_CASE("Created verifiers carry a normalized config", "[remote]")
{
    auto transport = std::make_shared<FakeTransport>();
    RemoteVerifierConfig cfg;
    cfg.base_url = "http://localhost:8003/";
    cfg.retries = -4;

    auto created = RemoteVerifier::create(cfg, transport);
    REQUIRE(created.has_value());
    REQUIRE(*created != nullptr);
    REQUIRE((*created)->config().base_url == "http://localhost:8003");
    REQUIRE((*created)->config().retries == 0);

    REQUIRE_FALSE(RemoteVerifier::create(cfg, nullptr).has_value());
}

TEST_CASE("Verify posts the token and environment to /verify", "[remote]")
{
    auto transport = std::make_shared<FakeTransport>();
    transport->push(verifier_ok(true, "pro", 4'000'000'000));
    auto verifier = make_verifier(transport);

    auto ent = verifier->verify("  tok.en.value \n", std::string("staging"));
    REQUIRE(ent.has_value());
    REQUIRE(ent->valid);
    REQUIRE(ent->tier == Tier::Pro);
    REQUIRE(ent->exp == 4'000'000'000);
    REQUIRE(ent->customer_id == std::optional<std::string>("cust-42"));

    REQUIRE(transport->calls() == 1);
    REQUIRE(transport->last_url().target == "/verify");
    REQUIRE(transport->last_url().port == 8003);

    auto body = nlohmann::json::parse(transport->last_body());
    REQUIRE(body["token"] == "tok.en.value");
    REQUIRE(body["environment"] == "staging");

    auto headers = transport->last_headers();
    REQUIRE(headers["Content-Type"] == "application/json");
    REQUIRE(headers["Accept"] == "application/json");
    REQUIRE(headers["User-Agent"] == "tiergate/remote-verifier");
}

TEST_CASE("Missing environment is sent as null", "[remote]")
{
    auto transport = std::make_shared<FakeTransport>();
    transport->push(verifier_ok(true, "pro", 4'000'000'000));
    auto verifier = make_verifier(transport);

    REQUIRE(verifier->verify("token", std::nullopt).has_value());
    REQUIRE(nlohmann::json::parse(transport->last_body())["environment"].is_null());
}

TEST_CASE("Verifier responses accept both field conventions", "[remote]")
{
    auto alt = RemoteVerifier::parse_response(R"({
        "valid": true,
        "license": {"exp": "1900000000", "tier": "ALL", "features": ["a", 7],
                    "customer": "c-1", "org": "Org", "seats": 3.0}
    })");
    REQUIRE(alt.has_value());
    REQUIRE(alt->valid);
    REQUIRE(alt->exp == 1'900'000'000);
    REQUIRE(alt->tier == Tier::Enterprise);
    REQUIRE(alt->features == std::vector<std::string>{"a", "7"});
    REQUIRE(alt->customer_id == std::optional<std::string>("c-1"));
    REQUIRE(alt->organization == std::optional<std::string>("Org"));
    REQUIRE(alt->seats == std::optional<int64_t>(3));

    auto revoked = RemoteVerifier::parse_response(R"({"valid": false, "error": "License revoked", "license": {"tier": "pro"}})");
    REQUIRE(revoked.has_value());
    REQUIRE_FALSE(revoked->valid);
    REQUIRE(revoked->error == std::optional<std::string>("License revoked"));

    auto unknown_tier = RemoteVerifier::parse_response(R"({"valid": true, "license": {"tier": "god-mode"}})");
    REQUIRE(unknown_tier->tier == Tier::Community);

    auto garbage = RemoteVerifier::parse_response("<html>oops</html>");
    REQUIRE_FALSE(garbage.has_value());
    REQUIRE(garbage.error().code == ErrorCode::ProtocolError);

    REQUIRE(RemoteVerifier::parse_response("[]").error().code == ErrorCode::ProtocolError);
}

TEST_CASE("Unrepresentable numbers from the verifier fail closed", "[remote]")
{
    auto huge = RemoteVerifier::parse_response(R"({"valid": true, "license": {"exp": 1e30, "tier": "pro", "seats": -1e30}})");
    REQUIRE(huge.has_value());
    REQUIRE(huge->exp == 0);
    REQUIRE_FALSE(huge->seats.has_value());

    auto wrapped = RemoteVerifier::parse_response(R"({"valid": true, "license": {"exp": 18446744073709551615, "tier": "pro"}})");
    REQUIRE(wrapped->exp == 0);
}

TEST_CASE("Transient failures are retried with a bound", "[remote]")
{
    auto transport = std::make_shared<FakeTransport>();
    transport->go_offline();

    SECTION("recovers within the retry budget")
    {
        transport->push(std::unexpected(TiergateError::network("timed out")));
        transport->push(HttpResponse{503, "busy"});
        transport->push(verifier_ok(true, "pro", 4'000'000'000));
        auto verifier = make_verifier(transport, 2);

        REQUIRE(verifier->verify("token", std::nullopt).has_value());
        REQUIRE(transport->calls() == 3);
    }

    SECTION("gives up after retries + 1 attempts")
    {
        auto verifier = make_verifier(transport, 2);
        const std::string token = "secret.token.material";

        auto result = verifier->verify(token, std::nullopt);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::NetworkError);
        REQUIRE(transport->calls() == 3);

        const std::string message = result.error().what();
        REQUIRE(message.find(token) == std::string::npos);
        REQUIRE(message.find(logging::hash_hint(token_hash(token))) != std::string::npos);
    }

    SECTION("zero retries means one attempt")
    {
        auto verifier = make_verifier(transport, 0);
        REQUIRE_FALSE(verifier->verify("token", std::nullopt).has_value());
        REQUIRE(transport->calls() == 1);
    }

    SECTION("malformed bodies surface as protocol errors")
    {
        transport->set_fallback(HttpResponse{200, "not json"});
        auto verifier = make_verifier(transport, 1);
        auto result = verifier->verify("token", std::nullopt);
        REQUIRE(result.error().code == ErrorCode::ProtocolError);
        REQUIRE(transport->calls() == 2);
    }
}

TEST_CASE("Token hashes ignore surrounding whitespace", "[remote]")
{
    REQUIRE(token_hash(" abc\n") == token_hash("abc"));
    REQUIRE(token_hash("abc").size() == 64);
}

TEST_CASE("Beast transport connects to address literals without resolving", "[remote][transport]")
{
    BeastHttpTransport transport;
    auto url = HttpUrl::parse("http://127.0.0.1:1/verify").value();

    auto response = transport.post(url, {{"Accept", "application/json"}}, "{}", std::chrono::milliseconds(500));
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().code == ErrorCode::NetworkError);
    REQUIRE(std::string(response.error().what()).find("resolve") == std::string::npos);
}
