#include "oauth.hpp"
#include "util.hpp"

#include <openssl/rand.h>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace mcphost {

using json = nlohmann::json;

namespace {

std::string base64url_encode(const unsigned char* data, size_t len) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    out.reserve((len * 4 + 2) / 3);

    size_t i = 0;
    while (i + 3 <= len) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        out.push_back(alphabet[(n >> 6) & 63]);
        out.push_back(alphabet[n & 63]);
        i += 3;
    }

    if (i < len) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        if (i + 1 < len) {
            out.push_back(alphabet[(n >> 6) & 63]);
        }
    }

    return out;
}

} // namespace

// ── URL encoding ─────────────────────────────────────────────────

std::string oauth_url_encode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

// ── Form encoding ────────────────────────────────────────────────

std::string form_encode(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string result;
    for (const auto& [key, value] : params) {
        if (!result.empty()) result += '&';
        result += oauth_url_encode(key) + '=' + oauth_url_encode(value);
    }
    return result;
}

// ── State ────────────────────────────────────────────────────────

std::string generate_state() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // RNG not seeded; still unique per run
        std::string id = generate_id() + generate_id();
        return base64url_encode(reinterpret_cast<const unsigned char*>(id.data()), id.size());
    }
    return base64url_encode(bytes, sizeof(bytes));
}

// ── Authorize URL builder ────────────────────────────────────────

std::string build_authorize_url(const OAuthConfig& config, const std::string& state) {
    const char sep = config.authorize_url.find('?') == std::string::npos ? '?' : '&';
    return config.authorize_url + sep +
        "client_id=" + config.client_id +
        "&redirect_uri=" + oauth_url_encode(config.redirect_uri) +
        "&response_type=code"
        "&state=" + state +
        "&scope=" + oauth_url_encode(config.scope);
}

// ── Token exchange ───────────────────────────────────────────────

TokenResult exchange_token(const OAuthConfig& config,
                           const std::string& code,
                           HttpClient& http,
                           Logger& log) {
    TokenResult result;

    std::string body = form_encode({
        {"grant_type", "authorization_code"},
        {"client_id", config.client_id},
        {"client_secret", config.client_secret},
        {"redirect_uri", config.redirect_uri},
        {"code", code}
    });
    log.info("oauth", "Exchanging authorization code at " + config.token_url);
    auto resp = http.post(config.token_url, body,
                          {{"Content-Type", "application/x-www-form-urlencoded"},
                           {"Accept", "application/json"}}, 120);
    result.status_code = resp.status_code;
    result.body = resp.body;

    if (resp.status_code == 0) {
        result.error_kind = ErrorKind::TokenExchangeHttp;
        result.error = resp.error.empty() ? "no response from token endpoint" : resp.error;
        return result;
    }
    if (!is_success(resp.status_code)) {
        result.error_kind = ErrorKind::TokenExchangeHttp;
        result.error = "Token exchange failed (HTTP " + std::to_string(resp.status_code) + ")";
        return result;
    }

    try {
        auto tok = json::parse(resp.body);
        if (!tok.is_object()) {
            result.error_kind = ErrorKind::TokenParse;
            result.error = "token response is not a JSON object";
            return result;
        }
        auto it = tok.find("access_token");
        if (it == tok.end() || !it->is_string() || it->get<std::string>().empty()) {
            result.error_kind = ErrorKind::TokenParse;
            result.error = "token response has no access_token";
            return result;
        }
        result.access_token = it->get<std::string>();
    } catch (const json::exception& e) {
        result.error_kind = ErrorKind::TokenParse;
        result.error = std::string("token response is not JSON: ") + e.what();
        return result;
    }

    result.ok = true;
    result.body.clear();
    log.info("oauth", "Access token obtained: " + redact_token(result.access_token));
    return result;
}

// ── Authorization flow ───────────────────────────────────────────

const char* flow_state_name(FlowState state) {
    switch (state) {
        case FlowState::Idle:             return "idle";
        case FlowState::ListenerArmed:    return "listener-armed";
        case FlowState::BrowserLaunched:  return "browser-launched";
        case FlowState::AwaitingCallback: return "awaiting-callback";
        case FlowState::Authorized:       return "authorized";
        case FlowState::Denied:           return "denied";
        case FlowState::Mismatched:       return "mismatched";
        case FlowState::Failed:           return "failed";
    }
    return "unknown";
}

AuthorizationFlow::AuthorizationFlow(const OAuthConfig& config,
                                     HttpClient& http,
                                     UserAgentLauncher& launcher,
                                     CallbackListener& listener,
                                     Logger& log)
    : config_(config)
    , http_(http)
    , launcher_(launcher)
    , listener_(listener)
    , log_(log)
{}

AuthFlowResult AuthorizationFlow::fail(AuthFlowResult result, FlowState next,
                                       ErrorKind kind, const std::string& error) {
    state_ = next;
    result.ok = false;
    result.error_kind = kind;
    result.error = error;
    log_.error("oauth", std::string(error_kind_name(kind)) + ": " + error);
    return result;
}

AuthFlowResult AuthorizationFlow::run(const std::string& state) {
    AuthFlowResult result;
    if (state_ != FlowState::Idle) {
        result.error_kind = ErrorKind::ListenerBind;
        result.error = "authorization flow already ran";
        return result;
    }

    result.state = state.empty() ? generate_state() : state;
    result.authorize_url = build_authorize_url(config_, result.state);

    std::string error;
    if (!listener_.arm(config_.redirect_uri, error)) {
        return fail(std::move(result), FlowState::Failed, ErrorKind::ListenerBind, error);
    }
    state_ = FlowState::ListenerArmed;

    log_.info("oauth", "Opening browser for authorization");
    if (!launcher_.launch(result.authorize_url, error)) {
        log_.warn("browser", std::string(error_kind_name(ErrorKind::BrowserLaunchWarning)) +
                             ": " + error + ". Open this URL manually: " + result.authorize_url);
    }
    state_ = FlowState::BrowserLaunched;

    log_.info("oauth", "Waiting for the authorization callback on " + config_.redirect_uri);
    state_ = FlowState::AwaitingCallback;
    auto outcome = listener_.wait();
    if (!outcome.ok) {
        return fail(std::move(result), FlowState::Failed, outcome.error_kind, outcome.error);
    }

    const auto& cb = outcome.result;
    if (cb.error) {
        return fail(std::move(result), FlowState::Denied, ErrorKind::CallbackError, *cb.error);
    }
    if (!cb.code) {
        return fail(std::move(result), FlowState::Denied, ErrorKind::MissingCode,
                    "No authorization code received");
    }
    if (!cb.state || *cb.state != result.state) {
        return fail(std::move(result), FlowState::Mismatched, ErrorKind::StateMismatch,
                    "state returned by the authorization server does not match");
    }

    log_.info("oauth", "Authorization code received");
    auto tok = exchange_token(config_, *cb.code, http_, log_);
    result.status_code = tok.status_code;
    if (!tok.ok) {
        result.body = tok.body;
        return fail(std::move(result), FlowState::Failed, tok.error_kind, tok.error);
    }

    state_ = FlowState::Authorized;
    result.ok = true;
    result.access_token = std::move(tok.access_token);
    return result;
}

} // namespace mcphost
