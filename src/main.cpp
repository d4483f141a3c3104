#include "callback_receiver.hpp"
#include "config.hpp"
#include "http.hpp"
#include "logger.hpp"
#include "message_router.hpp"
#include "oauth.hpp"
#include "rpc_dispatcher.hpp"
#include "stream_client.hpp"
#include "user_agent.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static constexpr const char* kClientName = "mcphost";
static constexpr const char* kClientVersion = "0.1.0";
static constexpr const char* kProtocolVersion = "2024-11-05";

static void print_usage() {
    std::cout << "Usage: mcphost [options]\n"
              << "\n"
              << "Authorizes against an OAuth2 provider, then listens on <server>/sse\n"
              << "and answers JSON-RPC pings through <server>/rpc.\n"
              << "\n"
              << "Options:\n"
              << "  --state VALUE        Fixed CSRF state (default: random per run)\n"
              << "  --no-browser         Print the authorization URL instead of opening it\n"
              << "  --timeout SECONDS    Give up waiting for the callback (0 = never)\n"
              << "  --server URL         Streaming server base URL\n"
              << "  --token TOKEN        Skip authorization and use this access token\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Configuration: ~/.mcphost/config.json\n"
              << "\n"
              << "Environment variables:\n"
              << "  MCPHOST_CLIENT_ID      OAuth client id\n"
              << "  MCPHOST_CLIENT_SECRET  OAuth client secret\n"
              << "  MCPHOST_SERVER_URL     Streaming server base URL\n"
              << "  MCPHOST_CALLBACK_URL   Redirect URI (default: http://localhost:8080/callback)\n"
              << "  MCPHOST_SCOPE          Requested scope\n"
              << "  MCPHOST_LOG_LEVEL      debug, info, warn or error\n";
}

static bool parse_seconds(const char* text, long& out) {
    try {
        size_t used = 0;
        long v = std::stol(text, &used);
        if (used != std::strlen(text) || v < 0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static nlohmann::json initialize_params() {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}
    };
}

int main(int argc, char* argv[]) {
    std::string state;
    std::string server_override;
    std::string token;
    bool no_browser = false;
    bool verbose = false;
    long timeout_override = -1;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            state = argv[++i];
        } else if (std::strcmp(argv[i], "--no-browser") == 0) {
            no_browser = true;
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            if (!parse_seconds(argv[++i], timeout_override)) {
                std::cerr << "Invalid --timeout value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server_override = argv[++i];
        } else if (std::strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
            token = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    mcphost::StderrLogger log;
    auto config = mcphost::Config::load(log);
    log.set_min_level(verbose ? mcphost::LogLevel::Debug
                              : mcphost::parse_log_level(config.log_level));

    if (!server_override.empty()) config.server_url = server_override;
    if (timeout_override >= 0) config.callback_timeout_seconds = timeout_override;
    if (no_browser) config.open_browser = false;

    // Interactive fallback for the secret, never stored
    if (token.empty() && config.oauth.client_secret.empty() && isatty(STDIN_FILENO)) {
        std::cout << "Enter client secret: " << std::flush;
        std::string line;
        if (std::getline(std::cin, line)) config.oauth.client_secret = mcphost::trim(line);
    }

    auto problems = config.validate();
    if (!token.empty()) {
        // Only the server is needed when a token is supplied
        problems.clear();
        if (config.server_url.empty())
            problems.emplace_back("server_url is not set (or MCPHOST_SERVER_URL)");
    }
    if (!problems.empty()) {
        for (const auto& p : problems) log.error("config", p);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    mcphost::http_init();
    mcphost::http_set_abort_flag(&g_shutdown);

    mcphost::PlatformHttpClient http;

    if (token.empty()) {
        mcphost::SystemBrowserLauncher system_launcher;
        mcphost::ManualLauncher manual_launcher;
        mcphost::UserAgentLauncher& launcher = config.open_browser
            ? static_cast<mcphost::UserAgentLauncher&>(system_launcher)
            : manual_launcher;
        mcphost::CallbackReceiver receiver(log, config.callback_timeout_seconds, &g_shutdown);

        mcphost::AuthorizationFlow flow(config.oauth, http, launcher, receiver, log);
        auto auth = flow.run(state);
        if (!auth.ok) {
            if (!auth.body.empty()) log.debug("oauth", "Token endpoint body: " + auth.body);
            std::cerr << "Authorization failed: "
                      << mcphost::error_kind_name(auth.error_kind) << ": " << auth.error << "\n";
            mcphost::http_cleanup();
            return 1;
        }
        token = auth.access_token;
    }

    std::cout << "Access token: " << mcphost::redact_token(token)
              << " (" << token.size() << " chars, obtained " << mcphost::local_time_now() << ")\n";

    mcphost::RpcDispatcher dispatcher(config.server_url, token, http, log,
                                      config.http_timeout_seconds);
    mcphost::MessageRouter router(dispatcher, log);
    router.set_observer([](const mcphost::JsonRpcMessage& msg) {
        std::cout << mcphost::kind_name(mcphost::kind_of(msg)) << ": "
                  << mcphost::to_wire(msg) << "\n";
    });

    mcphost::StreamClient stream(http, router, log, config.http_timeout_seconds);
    stream.set_on_open([&dispatcher, &log]() {
        auto init = dispatcher.request("initialize", initialize_params());
        if (!init.ok) log.warn("rpc", "initialize not accepted; listening anyway");
        auto ready = dispatcher.notify("notifications/initialized");
        if (!ready.ok) log.warn("rpc", "initialized notification not accepted");
    });

    auto result = stream.connect(config.server_url, token);
    mcphost::http_cleanup();

    log.info("sse", std::to_string(result.events) + " events, " +
                    std::to_string(result.routed) + " routed, " +
                    std::to_string(result.dropped) + " dropped, " +
                    std::to_string(router.replies_sent()) + " ping replies");

    if (result.ok || g_shutdown.load() || !mcphost::is_fatal(result.error_kind)) return 0;
    std::cerr << "Stream failed: " << mcphost::error_kind_name(result.error_kind)
              << ": " << result.error << "\n";
    return 1;
}
