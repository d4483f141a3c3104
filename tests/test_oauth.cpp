#include <catch2/catch.hpp>
#include "oauth.hpp"
#include "mock_http_client.hpp"
#include "recording_logger.hpp"

using namespace mcphost;

static OAuthConfig github_config() {
    OAuthConfig c;
    c.client_id = "cid";
    c.client_secret = "shh";
    return c;
}

// ── Constants ────────────────────────────────────────────────────

TEST_CASE("OAuth: defaults point at GitHub", "[oauth]") {
    OAuthConfig c;
    REQUIRE(c.authorize_url == "https://github.com/login/oauth/authorize");
    REQUIRE(c.token_url == "https://github.com/login/oauth/access_token");
    REQUIRE(c.redirect_uri == "http://localhost:8080/callback");
    REQUIRE(c.scope == "read:user user:email");
}

TEST_CASE("OAuth: legacy default state literal", "[oauth]") {
    REQUIRE(std::string(kLegacyDefaultState) == "random_state");
}

// ── oauth_url_encode ─────────────────────────────────────────────

TEST_CASE("oauth_url_encode: unreserved chars pass through", "[oauth]") {
    REQUIRE(oauth_url_encode("abc123") == "abc123");
    REQUIRE(oauth_url_encode("A-B_C.D~E") == "A-B_C.D~E");
}

TEST_CASE("oauth_url_encode: spaces encoded as %20", "[oauth]") {
    REQUIRE(oauth_url_encode("read:user user:email") == "read%3Auser%20user%3Aemail");
}

TEST_CASE("oauth_url_encode: empty string", "[oauth]") {
    REQUIRE(oauth_url_encode("").empty());
}

// ── form_encode ──────────────────────────────────────────────────

TEST_CASE("form_encode: builds key=value pairs", "[oauth]") {
    auto result = form_encode({{"grant_type", "authorization_code"}, {"code", "abc123"}});
    REQUIRE(result == "grant_type=authorization_code&code=abc123");
}

TEST_CASE("form_encode: encodes special characters in values", "[oauth]") {
    auto result = form_encode({{"redirect_uri", "http://localhost:8080/callback"}});
    REQUIRE(result == "redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback");
}

TEST_CASE("form_encode: empty params", "[oauth]") {
    REQUIRE(form_encode({}).empty());
}

// ── generate_state ───────────────────────────────────────────────

TEST_CASE("generate_state: 128 bits as base64url", "[oauth]") {
    auto s = generate_state();
    REQUIRE(s.size() == 22);
    for (char c : s) {
        bool valid = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '-' || c == '_';
        REQUIRE(valid);
    }
}

TEST_CASE("generate_state: differs between calls", "[oauth]") {
    REQUIRE(generate_state() != generate_state());
}

// ── build_authorize_url ──────────────────────────────────────────

TEST_CASE("build_authorize_url: exact parameter layout", "[oauth]") {
    auto url = build_authorize_url(github_config(), "s1");
    REQUIRE(url ==
        "https://github.com/login/oauth/authorize"
        "?client_id=cid"
        "&redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback"
        "&response_type=code"
        "&state=s1"
        "&scope=read%3Auser%20user%3Aemail");
}

TEST_CASE("build_authorize_url: appends to an existing query", "[oauth]") {
    auto c = github_config();
    c.authorize_url = "https://idp.example/authorize?tenant=t1";
    auto url = build_authorize_url(c, "s");
    REQUIRE(url.rfind("https://idp.example/authorize?tenant=t1&client_id=cid&", 0) == 0);
}

// ── exchange_token ───────────────────────────────────────────────

TEST_CASE("exchange_token: posts the form and reads access_token", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;
    http.next_response = {200, R"({"access_token":"abc123","token_type":"bearer"})", ""};

    auto r = exchange_token(github_config(), "XYZ", http, log);
    REQUIRE(r.ok);
    REQUIRE(r.access_token == "abc123");
    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_url == "https://github.com/login/oauth/access_token");
    REQUIRE(http.last_body ==
        "grant_type=authorization_code&client_id=cid&client_secret=shh"
        "&redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback&code=XYZ");
    REQUIRE(http.header("Accept") == "application/json");
    REQUIRE(http.header("Content-Type") == "application/x-www-form-urlencoded");
}

TEST_CASE("exchange_token: access token is not logged in full", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;
    http.next_response = {200, R"({"access_token":"gho_secretsecret"})", ""};

    auto r = exchange_token(github_config(), "c", http, log);
    REQUIRE(r.ok);
    REQUIRE_FALSE(log.contains("gho_secretsecret"));
}

TEST_CASE("exchange_token: body without access_token is a parse error", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;
    http.next_response = {200, R"({"foo":"bar"})", ""};

    auto r = exchange_token(github_config(), "c", http, log);
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error_kind == ErrorKind::TokenParse);
    REQUIRE(r.body == R"({"foo":"bar"})");
}

TEST_CASE("exchange_token: empty or non-string access_token is a parse error", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;

    http.next_response = {200, R"({"access_token":""})", ""};
    REQUIRE(exchange_token(github_config(), "c", http, log).error_kind == ErrorKind::TokenParse);

    http.next_response = {200, R"({"access_token":42})", ""};
    REQUIRE(exchange_token(github_config(), "c", http, log).error_kind == ErrorKind::TokenParse);
}

TEST_CASE("exchange_token: non-JSON or non-object body is a parse error", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;

    http.next_response = {200, "access_token=abc&token_type=bearer", ""};
    REQUIRE(exchange_token(github_config(), "c", http, log).error_kind == ErrorKind::TokenParse);

    http.next_response = {200, R"(["abc"])", ""};
    REQUIRE(exchange_token(github_config(), "c", http, log).error_kind == ErrorKind::TokenParse);
}

TEST_CASE("exchange_token: non-2xx keeps status and body", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;
    http.next_response = {401, R"({"error":"bad_verification_code"})", ""};

    auto r = exchange_token(github_config(), "c", http, log);
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error_kind == ErrorKind::TokenExchangeHttp);
    REQUIRE(r.status_code == 401);
    REQUIRE(r.body.find("bad_verification_code") != std::string::npos);
}

TEST_CASE("exchange_token: transport failure is an HTTP error with status 0", "[oauth]") {
    MockHttpClient http;
    RecordingLogger log;
    http.next_response = {0, "", "Connection failed"};

    auto r = exchange_token(github_config(), "c", http, log);
    REQUIRE(r.error_kind == ErrorKind::TokenExchangeHttp);
    REQUIRE(r.status_code == 0);
    REQUIRE(r.error == "Connection failed");
}
