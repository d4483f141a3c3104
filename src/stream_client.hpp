#pragma once
#include "errors.hpp"
#include "http.hpp"
#include "logger.hpp"
#include "message_router.hpp"
#include "sse.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mcphost {

struct StreamResult {
    bool ok = false;                    // stream ran and ended normally
    ErrorKind error_kind = ErrorKind::None;
    long status_code = 0;
    std::string body;                   // non-2xx response body
    std::string error;

    uint64_t events = 0;                // SSE events flushed
    uint64_t routed = 0;                // events that were valid JSON-RPC
    uint64_t dropped = 0;               // events dropped as malformed
};

// Opens <server>/sse with the bearer token and pumps every event's data
// into the router until the server closes the stream.
class StreamClient {
public:
    StreamClient(HttpClient& http, MessageRouter& router, Logger& log,
                 long connect_timeout_seconds = 30);

    // Runs once after a 2xx response head, before any event is routed.
    void set_on_open(std::function<void()> on_open) { on_open_ = std::move(on_open); }

    // Sees every flushed event before routing (diagnostics).
    void set_event_observer(std::function<void(const SSEEvent&)> observer) {
        event_observer_ = std::move(observer);
    }

    // Blocks for the life of the stream. Each call opens a new stream.
    StreamResult connect(const std::string& server_url, const std::string& token);

    static std::vector<Header> stream_headers(const std::string& token);

private:
    HttpClient& http_;
    MessageRouter& router_;
    Logger& log_;
    long connect_timeout_seconds_;
    std::function<void()> on_open_;
    std::function<void(const SSEEvent&)> event_observer_;
    SSEParser parser_;
};

} // namespace mcphost
