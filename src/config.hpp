#pragma once
#include "logger.hpp"
#include "oauth.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphost {

constexpr const char* kDefaultConfigPath = "~/.mcphost/config.json";

struct Config {
    OAuthConfig oauth;
    std::string server_url;              // no default; must be configured
    long callback_timeout_seconds = 0;   // 0 = wait forever
    long http_timeout_seconds = 30;
    std::string log_level = "info";
    bool open_browser = true;

    // Load from ~/.mcphost/config.json (or path) + env vars.
    // Writes the defaults when the file is missing and adds new default
    // keys to an existing file.
    static Config load(Logger& log, const std::string& path = kDefaultConfigPath);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Fields of the wrong type keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // MCPHOST_* environment variables override file values.
    void apply_env();

    // One message per missing required setting; empty when usable.
    std::vector<std::string> validate() const;
};

} // namespace mcphost
