#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace mcphost {

constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC 2.0 error codes
constexpr int kJsonRpcParseError     = -32700;
constexpr int kJsonRpcInvalidRequest = -32600;
constexpr int kJsonRpcMethodNotFound = -32601;

// Integer or string; null is only accepted on error responses.
using RpcId = nlohmann::json;

struct JsonRpcRequest {
    RpcId id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcResponse {
    RpcId id;
    nlohmann::json result = nlohmann::json::object();
};

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct JsonRpcErrorResponse {
    RpcId id;
    JsonRpcError error;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest,
                                    JsonRpcResponse,
                                    JsonRpcErrorResponse,
                                    JsonRpcNotification>;

enum class JsonRpcKind { Request, Response, ErrorResponse, Notification };

JsonRpcKind kind_of(const JsonRpcMessage& message);
const char* kind_name(JsonRpcKind kind);

// Serialize with "jsonrpc" first, then id, then method/params, result or error.
nlohmann::ordered_json to_json_value(const JsonRpcMessage& message);
std::string to_wire(const JsonRpcMessage& message);

struct JsonRpcParseResult {
    std::optional<JsonRpcMessage> message;
    std::string error; // why the payload was rejected

    bool ok() const { return message.has_value(); }
};

// Validate and decode one envelope. Never throws.
JsonRpcParseResult parse_jsonrpc(const std::string& text);
JsonRpcParseResult parse_jsonrpc(const nlohmann::json& j);

// Printable id for diagnostics ("7", "\"abc\"", "null")
std::string id_to_string(const RpcId& id);

} // namespace mcphost
