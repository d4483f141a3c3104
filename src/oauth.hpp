#pragma once
#include "callback_receiver.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "logger.hpp"
#include "user_agent.hpp"
#include <string>
#include <utility>
#include <vector>

namespace mcphost {

// ── Constants ────────────────────────────────────────────────────
constexpr const char* kDefaultAuthorizeUrl = "https://github.com/login/oauth/authorize";
constexpr const char* kDefaultTokenUrl = "https://github.com/login/oauth/access_token";
constexpr const char* kDefaultRedirectUri = "http://localhost:8080/callback";
constexpr const char* kDefaultScope = "read:user user:email";

// Fixed state value older deployments expect; prefer generate_state().
constexpr const char* kLegacyDefaultState = "random_state";

struct OAuthConfig {
    std::string authorize_url = kDefaultAuthorizeUrl;
    std::string token_url = kDefaultTokenUrl;
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri = kDefaultRedirectUri;
    std::string scope = kDefaultScope;
};

// ── URL encoding ─────────────────────────────────────────────────
// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string oauth_url_encode(const std::string& s);

// ── Form encoding ────────────────────────────────────────────────
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& params);

// ── State ────────────────────────────────────────────────────────
// 128 random bits, base64url without padding.
std::string generate_state();

// ── Authorize URL builder ────────────────────────────────────────
std::string build_authorize_url(const OAuthConfig& config, const std::string& state);

// ── Token exchange ───────────────────────────────────────────────
struct TokenResult {
    bool ok = false;
    std::string access_token;
    ErrorKind error_kind = ErrorKind::None;
    long status_code = 0;
    std::string body;     // raw token endpoint body, kept on failure
    std::string error;
};

// Single POST to config.token_url. No retries.
TokenResult exchange_token(const OAuthConfig& config,
                           const std::string& code,
                           HttpClient& http,
                           Logger& log);

// ── Authorization flow ───────────────────────────────────────────
enum class FlowState {
    Idle,
    ListenerArmed,
    BrowserLaunched,
    AwaitingCallback,
    Authorized,
    Denied,
    Mismatched,
    Failed
};

const char* flow_state_name(FlowState state);

struct AuthFlowResult {
    bool ok = false;
    std::string access_token;
    std::string authorize_url;
    std::string state;              // state sent with the request
    ErrorKind error_kind = ErrorKind::None;
    long status_code = 0;           // token endpoint status, if reached
    std::string body;
    std::string error;
};

// Runs one authorization-code grant: arm the listener, open the user agent,
// wait for the redirect, check it, exchange the code. Single use.
class AuthorizationFlow {
public:
    AuthorizationFlow(const OAuthConfig& config,
                      HttpClient& http,
                      UserAgentLauncher& launcher,
                      CallbackListener& listener,
                      Logger& log);

    // Empty state: a fresh random value is generated.
    AuthFlowResult run(const std::string& state = "");

    FlowState state() const { return state_; }

private:
    AuthFlowResult fail(AuthFlowResult result, FlowState next,
                        ErrorKind kind, const std::string& error);

    const OAuthConfig& config_;
    HttpClient& http_;
    UserAgentLauncher& launcher_;
    CallbackListener& listener_;
    Logger& log_;
    FlowState state_ = FlowState::Idle;
};

} // namespace mcphost
