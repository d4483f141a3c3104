#pragma once
#include "callback_receiver.hpp"
#include "user_agent.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

class FakeLauncher : public UserAgentLauncher {
public:
    bool succeed = true;
    std::vector<std::string> urls;

    bool launch(const std::string& url, std::string& error) override {
        urls.push_back(url);
        if (!succeed) error = "no display";
        return succeed;
    }
};

// Delivers a scripted redirect instead of listening on a socket.
class FakeCallbackListener : public CallbackListener {
public:
    CallbackOutcome outcome;
    bool arm_ok = true;
    std::string armed_uri;
    int arm_calls = 0;
    int wait_calls = 0;

    // Launches seen when arm() ran; the listener must be armed first.
    const FakeLauncher* launcher = nullptr;
    size_t launches_at_arm = 0;

    bool arm(const std::string& redirect_uri, std::string& error) override {
        arm_calls++;
        armed_uri = redirect_uri;
        if (launcher) launches_at_arm = launcher->urls.size();
        if (!arm_ok) error = "address already in use";
        return arm_ok;
    }

    CallbackOutcome wait() override {
        wait_calls++;
        return outcome;
    }

    void deliver(std::optional<std::string> code,
                 std::optional<std::string> state,
                 std::optional<std::string> error = std::nullopt) {
        outcome.ok = true;
        outcome.result.code = std::move(code);
        outcome.result.state = std::move(state);
        outcome.result.error = std::move(error);
    }
};

} // namespace mcphost
