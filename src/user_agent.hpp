#pragma once
#include <string>

namespace mcphost {

// Opens a URL for the user. Failure is reported, never thrown.
class UserAgentLauncher {
public:
    virtual ~UserAgentLauncher() = default;
    virtual bool launch(const std::string& url, std::string& error) = 0;
};

// Hands the URL to the desktop opener (xdg-open, or open on macOS).
class SystemBrowserLauncher : public UserAgentLauncher {
public:
    bool launch(const std::string& url, std::string& error) override;
};

// Launches nothing; the caller prints the URL instead (--no-browser).
class ManualLauncher : public UserAgentLauncher {
public:
    bool launch(const std::string& url, std::string& error) override;
};

} // namespace mcphost
