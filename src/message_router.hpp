#pragma once
#include "jsonrpc.hpp"
#include "logger.hpp"
#include "rpc_dispatcher.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace mcphost {

enum class RouteAction {
    Replied,    // inbound request answered through the sender
    Unhandled,  // inbound request with no handler; no reply sent
    Surfaced,   // response, error response or notification handed to the observer
    Dropped     // payload was not a valid JSON-RPC envelope
};

const char* route_action_name(RouteAction action);

// Inbound half of the split channel: decides what each envelope read from
// the event stream needs. Only "ping" is answered.
class MessageRouter {
public:
    using Observer = std::function<void(const JsonRpcMessage&)>;

    MessageRouter(MessageSender& sender, Logger& log);

    RouteAction route(const JsonRpcMessage& message);

    // Parse then route. Malformed payloads are logged and dropped.
    RouteAction route_payload(const std::string& data);

    // Receives responses, error responses and notifications.
    void set_observer(Observer observer) { observer_ = std::move(observer); }

    uint64_t replies_sent() const { return replies_sent_; }
    uint64_t dropped_count() const { return dropped_; }

private:
    RouteAction handle_request(const JsonRpcRequest& request);
    void surface(const JsonRpcMessage& message);

    MessageSender& sender_;
    Logger& log_;
    Observer observer_;
    uint64_t replies_sent_ = 0;
    uint64_t dropped_ = 0;
};

} // namespace mcphost
