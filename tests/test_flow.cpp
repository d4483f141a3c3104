#include <catch2/catch.hpp>
#include "oauth.hpp"
#include "fake_auth.hpp"
#include "mock_http_client.hpp"
#include "recording_logger.hpp"

using namespace mcphost;

namespace {

struct FlowFixture {
    OAuthConfig config;
    MockHttpClient http;
    FakeLauncher launcher;
    FakeCallbackListener listener;
    RecordingLogger log;

    FlowFixture() {
        config.client_id = "cid";
        config.client_secret = "shh";
        listener.launcher = &launcher;
        http.next_response = {200, R"({"access_token":"tok"})", ""};
    }
};

} // namespace

TEST_CASE("Flow: end to end exchanges the code once", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.ok);
    REQUIRE(r.access_token == "tok");
    REQUIRE(flow.state() == FlowState::Authorized);
    REQUIRE(f.http.call_count == 1);
    REQUIRE(f.http.last_body.find("&code=XYZ") != std::string::npos);
}

TEST_CASE("Flow: callback error short-circuits before exchange", "[flow]") {
    FlowFixture f;
    f.listener.deliver(std::nullopt, "s1", "access_denied");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error_kind == ErrorKind::CallbackError);
    REQUIRE(r.error == "access_denied");
    REQUIRE(flow.state() == FlowState::Denied);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: error wins even when a code is present", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", "s1", "server_error");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::CallbackError);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: missing code", "[flow]") {
    FlowFixture f;
    f.listener.deliver(std::nullopt, "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::MissingCode);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: state mismatch never reaches the token endpoint", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", "evil");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::StateMismatch);
    REQUIRE(flow.state() == FlowState::Mismatched);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: absent state counts as a mismatch", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", std::nullopt);
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    REQUIRE(flow.run("s1").error_kind == ErrorKind::StateMismatch);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: listener is armed before the browser opens", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    REQUIRE(flow.run("s1").ok);
    REQUIRE(f.listener.arm_calls == 1);
    REQUIRE(f.listener.launches_at_arm == 0);
    REQUIRE(f.listener.armed_uri == "http://localhost:8080/callback");
    REQUIRE(f.launcher.urls.size() == 1);
    REQUIRE(f.launcher.urls[0] == build_authorize_url(f.config, "s1"));
}

TEST_CASE("Flow: browser launch failure is only a warning", "[flow]") {
    FlowFixture f;
    f.launcher.succeed = false;
    f.listener.deliver("XYZ", "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.ok);
    REQUIRE(f.log.contains("BrowserLaunchWarning"));
    REQUIRE(f.log.contains(r.authorize_url));
}

TEST_CASE("Flow: bind failure stops before launching", "[flow]") {
    FlowFixture f;
    f.listener.arm_ok = false;
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::ListenerBind);
    REQUIRE(flow.state() == FlowState::Failed);
    REQUIRE(f.launcher.urls.empty());
    REQUIRE(f.listener.wait_calls == 0);
}

TEST_CASE("Flow: callback timeout propagates", "[flow]") {
    FlowFixture f;
    f.listener.outcome.ok = false;
    f.listener.outcome.error_kind = ErrorKind::CallbackTimeout;
    f.listener.outcome.error = "no authorization callback within 5s";
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::CallbackTimeout);
    REQUIRE(f.http.call_count == 0);
}

TEST_CASE("Flow: token endpoint failure is the flow failure", "[flow]") {
    FlowFixture f;
    f.http.next_response = {200, R"({"foo":"bar"})", ""};
    f.listener.deliver("XYZ", "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    auto r = flow.run("s1");
    REQUIRE(r.error_kind == ErrorKind::TokenParse);
    REQUIRE(r.body == R"({"foo":"bar"})");
    REQUIRE(flow.state() == FlowState::Failed);
}

TEST_CASE("Flow: empty state generates a fresh one", "[flow]") {
    FlowFixture f;
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);
    f.listener.deliver("XYZ", "unknown");

    auto r = flow.run("");
    REQUIRE(r.state.size() == 22);
    REQUIRE(r.authorize_url.find("&state=" + r.state + "&") != std::string::npos);
}

TEST_CASE("Flow: runs only once", "[flow]") {
    FlowFixture f;
    f.listener.deliver("XYZ", "s1");
    AuthorizationFlow flow(f.config, f.http, f.launcher, f.listener, f.log);

    REQUIRE(flow.run("s1").ok);
    auto again = flow.run("s1");
    REQUIRE_FALSE(again.ok);
    REQUIRE(f.listener.arm_calls == 1);
    REQUIRE(f.http.call_count == 1);
}
