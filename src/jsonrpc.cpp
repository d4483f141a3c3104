#include "jsonrpc.hpp"

namespace mcphost {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

// Every alternative needs an overload, so a new one fails to compile here.
struct KindOf {
    JsonRpcKind operator()(const JsonRpcRequest&) const { return JsonRpcKind::Request; }
    JsonRpcKind operator()(const JsonRpcResponse&) const { return JsonRpcKind::Response; }
    JsonRpcKind operator()(const JsonRpcErrorResponse&) const { return JsonRpcKind::ErrorResponse; }
    JsonRpcKind operator()(const JsonRpcNotification&) const { return JsonRpcKind::Notification; }
};

} // namespace

JsonRpcKind kind_of(const JsonRpcMessage& message) {
    return std::visit(KindOf{}, message);
}

const char* kind_name(JsonRpcKind kind) {
    switch (kind) {
        case JsonRpcKind::Request:       return "request";
        case JsonRpcKind::Response:      return "response";
        case JsonRpcKind::ErrorResponse: return "error";
        case JsonRpcKind::Notification:  return "notification";
    }
    return "unknown";
}

// ── Serialization ────────────────────────────────────────────────

namespace {

struct WireBuilder {
    ordered_json& out;

    void operator()(const JsonRpcRequest& r) const {
        out["id"] = r.id;
        out["method"] = r.method;
        if (r.params) out["params"] = *r.params;
    }
    void operator()(const JsonRpcResponse& r) const {
        out["id"] = r.id;
        out["result"] = r.result;
    }
    void operator()(const JsonRpcErrorResponse& r) const {
        out["id"] = r.id;
        ordered_json err;
        err["code"] = r.error.code;
        err["message"] = r.error.message;
        if (r.error.data) err["data"] = *r.error.data;
        out["error"] = std::move(err);
    }
    void operator()(const JsonRpcNotification& n) const {
        out["method"] = n.method;
        if (n.params) out["params"] = *n.params;
    }
};

bool valid_id(const json& id) {
    return id.is_number_integer() || id.is_string();
}

} // namespace

ordered_json to_json_value(const JsonRpcMessage& message) {
    ordered_json out = ordered_json::object();
    out["jsonrpc"] = kJsonRpcVersion;
    std::visit(WireBuilder{out}, message);
    return out;
}

std::string to_wire(const JsonRpcMessage& message) {
    return to_json_value(message).dump();
}

// ── Deserialization ──────────────────────────────────────────────

static JsonRpcParseResult reject(std::string why) {
    JsonRpcParseResult r;
    r.error = std::move(why);
    return r;
}

JsonRpcParseResult parse_jsonrpc(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return reject(std::string("invalid JSON: ") + e.what());
    }
    return parse_jsonrpc(j);
}

JsonRpcParseResult parse_jsonrpc(const json& j) {
    if (j.is_array()) return reject("batch messages are not supported");
    if (!j.is_object()) return reject("envelope is not a JSON object");

    auto ver = j.find("jsonrpc");
    if (ver == j.end() || !ver->is_string() || ver->get<std::string>() != kJsonRpcVersion)
        return reject("missing or wrong \"jsonrpc\" version (expected \"2.0\")");

    bool has_method = j.contains("method");
    bool has_result = j.contains("result");
    bool has_error  = j.contains("error");
    bool has_id     = j.contains("id");

    if (has_result && has_error)
        return reject("envelope carries both \"result\" and \"error\"");

    std::optional<json> params;
    if (j.contains("params")) {
        const auto& p = j["params"];
        if (!p.is_object() && !p.is_array())
            return reject("\"params\" must be an object or array");
        params = p;
    }

    if (has_method) {
        if (has_result || has_error)
            return reject("request carries \"result\" or \"error\"");
        if (!j["method"].is_string())
            return reject("\"method\" must be a string");
        std::string method = j["method"].get<std::string>();

        if (!has_id) {
            JsonRpcParseResult r;
            r.message = JsonRpcNotification{std::move(method), std::move(params)};
            return r;
        }
        if (!valid_id(j["id"]))
            return reject("request \"id\" must be an integer or string");
        JsonRpcParseResult r;
        r.message = JsonRpcRequest{j["id"], std::move(method), std::move(params)};
        return r;
    }

    if (has_result) {
        if (!has_id || !valid_id(j["id"]))
            return reject("response \"id\" must be an integer or string");
        JsonRpcParseResult r;
        r.message = JsonRpcResponse{j["id"], j["result"]};
        return r;
    }

    if (has_error) {
        if (!has_id || !(valid_id(j["id"]) || j["id"].is_null()))
            return reject("error response \"id\" must be an integer, string or null");
        const auto& e = j["error"];
        if (!e.is_object())
            return reject("\"error\" must be an object");
        if (!e.contains("code") || !e["code"].is_number_integer())
            return reject("\"error.code\" must be an integer");
        if (!e.contains("message") || !e["message"].is_string())
            return reject("\"error.message\" must be a string");

        JsonRpcError err;
        err.code = e["code"].get<int>();
        err.message = e["message"].get<std::string>();
        if (e.contains("data")) err.data = e["data"];

        JsonRpcParseResult r;
        r.message = JsonRpcErrorResponse{j["id"], std::move(err)};
        return r;
    }

    return reject("envelope has no \"method\", \"result\" or \"error\"");
}

std::string id_to_string(const RpcId& id) {
    return id.dump();
}

} // namespace mcphost
