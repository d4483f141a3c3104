#include "rpc_dispatcher.hpp"
#include "util.hpp"

namespace mcphost {

RpcDispatcher::RpcDispatcher(const std::string& server_url,
                             std::string token,
                             HttpClient& http,
                             Logger& log,
                             long timeout_seconds)
    : endpoint_(join_url(server_url, "/rpc"))
    , token_(std::move(token))
    , http_(http)
    , log_(log)
    , timeout_seconds_(timeout_seconds)
{}

RpcSendResult RpcDispatcher::send(const JsonRpcMessage& message) {
    std::string body = to_wire(message);
    log_.debug("rpc", "-> " + body);

    auto resp = http_.post(endpoint_, body,
                           {bearer_header(token_), {"Content-Type", "application/json"}},
                           timeout_seconds_);
    ++sent_count_;

    RpcSendResult result;
    result.status_code = resp.status_code;
    result.body = std::move(resp.body);

    if (resp.status_code == 0) {
        result.error = resp.error.empty() ? "no response" : resp.error;
        log_.warn("rpc", std::string("Send of ") + kind_name(kind_of(message)) +
                         " failed: " + result.error);
        return result;
    }
    if (!is_success(resp.status_code)) {
        result.error = "HTTP " + std::to_string(resp.status_code);
        log_.warn("rpc", std::string("Send of ") + kind_name(kind_of(message)) +
                         " rejected (" + result.error + "): " + result.body);
        return result;
    }

    result.ok = true;
    log_.debug("rpc", "<- HTTP " + std::to_string(resp.status_code) +
                      (result.body.empty() ? "" : " " + result.body));
    return result;
}

RpcSendResult RpcDispatcher::request(const std::string& method,
                                     std::optional<nlohmann::json> params) {
    JsonRpcRequest req;
    req.id = next_id();
    req.method = method;
    req.params = std::move(params);
    log_.info("rpc", "Sending request " + method + " (id " + id_to_string(req.id) + ")");
    return send(req);
}

RpcSendResult RpcDispatcher::notify(const std::string& method,
                                    std::optional<nlohmann::json> params) {
    log_.info("rpc", "Sending notification " + method);
    return send(JsonRpcNotification{method, std::move(params)});
}

} // namespace mcphost
