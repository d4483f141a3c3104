#include "message_router.hpp"
#include "errors.hpp"

namespace mcphost {

const char* route_action_name(RouteAction action) {
    switch (action) {
        case RouteAction::Replied:   return "replied";
        case RouteAction::Unhandled: return "unhandled";
        case RouteAction::Surfaced:  return "surfaced";
        case RouteAction::Dropped:   return "dropped";
    }
    return "unknown";
}

MessageRouter::MessageRouter(MessageSender& sender, Logger& log)
    : sender_(sender)
    , log_(log)
{}

RouteAction MessageRouter::route_payload(const std::string& data) {
    auto parsed = parse_jsonrpc(data);
    if (!parsed.ok()) {
        ++dropped_;
        log_.warn("router", std::string(error_kind_name(ErrorKind::MessageParse)) +
                            ": " + parsed.error + " (payload dropped)");
        log_.debug("router", "Dropped payload: " + data);
        return RouteAction::Dropped;
    }
    return route(*parsed.message);
}

RouteAction MessageRouter::route(const JsonRpcMessage& message) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&message)) {
        return handle_request(*req);
    }

    if (const auto* resp = std::get_if<JsonRpcResponse>(&message)) {
        log_.info("router", "Response id " + id_to_string(resp->id) + ": " + resp->result.dump());
    } else if (const auto* err = std::get_if<JsonRpcErrorResponse>(&message)) {
        log_.warn("router", "Error response id " + id_to_string(err->id) + ": " +
                            std::to_string(err->error.code) + " " + err->error.message);
    } else if (const auto* note = std::get_if<JsonRpcNotification>(&message)) {
        log_.info("router", "Notification " + note->method);
    }
    surface(message);
    return RouteAction::Surfaced;
}

RouteAction MessageRouter::handle_request(const JsonRpcRequest& request) {
    if (request.method != "ping") {
        log_.warn("router", "Unhandled request " + request.method + " (id " +
                            id_to_string(request.id) + "); no reply sent");
        return RouteAction::Unhandled;
    }

    log_.debug("router", "ping id " + id_to_string(request.id));
    JsonRpcResponse reply{request.id, nlohmann::json::object()};
    auto sent = sender_.send(reply);
    ++replies_sent_;
    if (!sent.ok) {
        log_.warn("router", "ping reply for id " + id_to_string(request.id) +
                            " not accepted: " + sent.error);
    }
    return RouteAction::Replied;
}

void MessageRouter::surface(const JsonRpcMessage& message) {
    if (observer_) observer_(message);
}

} // namespace mcphost
