#pragma once
#include "http.hpp"
#include "jsonrpc.hpp"
#include "logger.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mcphost {

struct RpcSendResult {
    bool ok = false;
    long status_code = 0;
    std::string body;  // captured for diagnostics only
    std::string error;
};

// Outbound half of the split channel. Implemented by RpcDispatcher;
// the router only needs this much.
class MessageSender {
public:
    virtual ~MessageSender() = default;
    virtual RpcSendResult send(const JsonRpcMessage& message) = 0;
};

// POSTs JSON-RPC envelopes to <server>/rpc. Fire-and-forget: the POST
// response is not a JSON-RPC reply; replies arrive on the event stream.
class RpcDispatcher : public MessageSender {
public:
    RpcDispatcher(const std::string& server_url,
                  std::string token,
                  HttpClient& http,
                  Logger& log,
                  long timeout_seconds = 30);

    RpcSendResult send(const JsonRpcMessage& message) override;

    // Build a request with the next id and send it.
    RpcSendResult request(const std::string& method,
                          std::optional<nlohmann::json> params = std::nullopt);

    RpcSendResult notify(const std::string& method,
                         std::optional<nlohmann::json> params = std::nullopt);

    // Monotonic, starting at 1. Nothing tracks ids once sent.
    int64_t next_id() { return next_id_++; }

    const std::string& endpoint() const { return endpoint_; }
    uint64_t sent_count() const { return sent_count_; }

private:
    std::string endpoint_;
    std::string token_;
    HttpClient& http_;
    Logger& log_;
    long timeout_seconds_;
    int64_t next_id_ = 1;
    uint64_t sent_count_ = 0;
};

} // namespace mcphost
