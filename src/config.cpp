#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mcphost {

nlohmann::json Config::defaults_json() {
    return {
        {"oauth", {
            {"authorize_url", kDefaultAuthorizeUrl},
            {"token_url", kDefaultTokenUrl},
            {"client_id", ""},
            {"client_secret", ""},
            {"redirect_uri", kDefaultRedirectUri},
            {"scope", kDefaultScope}
        }},
        {"server_url", ""},
        {"callback_timeout_seconds", 0},
        {"http_timeout_seconds", 30},
        {"log_level", "info"},
        {"open_browser", true}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("oauth") && j["oauth"].is_object()) {
        auto& o = j["oauth"];
        read_string(o, "authorize_url", cfg.oauth.authorize_url);
        read_string(o, "token_url", cfg.oauth.token_url);
        read_string(o, "client_id", cfg.oauth.client_id);
        read_string(o, "client_secret", cfg.oauth.client_secret);
        read_string(o, "redirect_uri", cfg.oauth.redirect_uri);
        read_string(o, "scope", cfg.oauth.scope);
    }

    read_string(j, "server_url", cfg.server_url);
    read_string(j, "log_level", cfg.log_level);

    if (j.contains("callback_timeout_seconds") && j["callback_timeout_seconds"].is_number_unsigned())
        cfg.callback_timeout_seconds = j["callback_timeout_seconds"].get<long>();
    if (j.contains("http_timeout_seconds") && j["http_timeout_seconds"].is_number_unsigned())
        cfg.http_timeout_seconds = j["http_timeout_seconds"].get<long>();
    if (j.contains("open_browser") && j["open_browser"].is_boolean())
        cfg.open_browser = j["open_browser"].get<bool>();

    return cfg;
}

Config Config::load(Logger& log, const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    log.info("config", "Migrated config with new defaults: " + config_path);
            }
        } catch (const nlohmann::json::exception& e) {
            log.warn("config", "Ignoring malformed " + config_path + ": " + e.what());
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            log.info("config", "Created default config: " + config_path);
        else
            log.warn("config", "Could not write default config: " + config_path);
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("MCPHOST_CLIENT_ID"))
        oauth.client_id = v;
    if (const char* v = std::getenv("MCPHOST_CLIENT_SECRET"))
        oauth.client_secret = v;
    if (const char* v = std::getenv("MCPHOST_SERVER_URL"))
        server_url = v;
    if (const char* v = std::getenv("MCPHOST_CALLBACK_URL"))
        oauth.redirect_uri = v;
    if (const char* v = std::getenv("MCPHOST_SCOPE"))
        oauth.scope = v;
    if (const char* v = std::getenv("MCPHOST_LOG_LEVEL"))
        log_level = v;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    if (oauth.client_id.empty())
        problems.emplace_back("oauth.client_id is not set (or MCPHOST_CLIENT_ID)");
    if (oauth.client_secret.empty())
        problems.emplace_back("oauth.client_secret is not set (or MCPHOST_CLIENT_SECRET)");
    if (oauth.authorize_url.empty())
        problems.emplace_back("oauth.authorize_url is empty");
    if (oauth.token_url.empty())
        problems.emplace_back("oauth.token_url is empty");
    if (oauth.redirect_uri.empty())
        problems.emplace_back("oauth.redirect_uri is empty");
    if (server_url.empty())
        problems.emplace_back("server_url is not set (or MCPHOST_SERVER_URL)");
    return problems;
}

} // namespace mcphost
