#include "stream_client.hpp"
#include "util.hpp"

namespace mcphost {

StreamClient::StreamClient(HttpClient& http, MessageRouter& router, Logger& log,
                           long connect_timeout_seconds)
    : http_(http)
    , router_(router)
    , log_(log)
    , connect_timeout_seconds_(connect_timeout_seconds)
{}

std::vector<Header> StreamClient::stream_headers(const std::string& token) {
    return {
        bearer_header(token),
        {"Accept", "text/event-stream"},
        {"Cache-Control", "no-cache"}
    };
}

StreamResult StreamClient::connect(const std::string& server_url, const std::string& token) {
    StreamResult result;
    parser_.reset();

    std::string url = join_url(server_url, "/sse");
    log_.info("sse", "Connecting to SSE endpoint: " + url);

    auto on_open = [this](long status) {
        log_.info("sse", "Connected (HTTP " + std::to_string(status) + "), listening for events");
        if (on_open_) on_open_();
    };

    auto on_event = [this, &result](const SSEEvent& ev) {
        ++result.events;
        if (ev.event) log_.debug("sse", "Event type: " + *ev.event);
        log_.debug("sse", "Data: " + ev.data);
        if (event_observer_) event_observer_(ev);

        if (router_.route_payload(ev.data) == RouteAction::Dropped) {
            ++result.dropped;
        } else {
            ++result.routed;
        }
        return true;
    };

    auto on_chunk = [this, &on_event](const char* data, size_t len) {
        return parser_.feed(data, len, on_event);
    };

    auto resp = http_.stream_get_raw(url, stream_headers(token), on_open, on_chunk,
                                     connect_timeout_seconds_);
    result.status_code = resp.status_code;

    if (resp.status_code == 0) {
        result.error_kind = ErrorKind::StreamConnect;
        result.error = resp.error.empty() ? "no response from " + url : resp.error;
        log_.error("sse", std::string(error_kind_name(result.error_kind)) + ": " + result.error);
        return result;
    }

    if (!is_success(resp.status_code)) {
        result.error_kind = ErrorKind::StreamConnect;
        result.body = std::move(resp.body);
        result.error = "HTTP " + std::to_string(resp.status_code);
        log_.error("sse", std::string(error_kind_name(result.error_kind)) + ": " + result.error +
                          (result.body.empty() ? "" : " " + result.body));
        return result;
    }

    if (parser_.overflowed()) {
        result.error_kind = ErrorKind::StreamRead;
        result.error = "event line exceeds " + std::to_string(parser_.max_line_bytes()) + " bytes";
        parser_.finish();
        log_.error("sse", std::string(error_kind_name(result.error_kind)) + ": " + result.error);
        return result;
    }

    if (parser_.has_pending()) {
        log_.debug("sse", "Discarding unterminated event at end of stream");
    }
    parser_.finish();

    if (!resp.error.empty()) {
        result.error_kind = ErrorKind::StreamRead;
        result.error = resp.error;
        log_.error("sse", std::string(error_kind_name(result.error_kind)) + ": " + result.error);
        return result;
    }

    result.ok = true;
    log_.info("sse", "Stream closed by server after " + std::to_string(result.events) + " events");
    return result;
}

} // namespace mcphost
