#pragma once
#include <cstddef>
#include <string>
#include <optional>
#include <functional>

namespace mcphost {

struct SSEEvent {
    std::optional<std::string> event; // type from an "event:" line, if any
    std::string data;                 // "data:" lines joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental text/event-stream parser. Lines and events may be split across
// any number of feed() calls.
class SSEParser {
public:
    static constexpr size_t kDefaultMaxLineBytes = 1024 * 1024;

    explicit SSEParser(size_t max_line_bytes = kDefaultMaxLineBytes)
        : max_line_bytes_(max_line_bytes) {}

    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop or a line outgrew the cap.
    bool feed(const std::string& chunk, const SSECallback& callback);
    bool feed(const char* data, size_t len, const SSECallback& callback);

    // Stream ended: drop any partial line and unterminated event.
    void finish();

    // Reset parser state
    void reset();

    // True while an unterminated event or partial line is buffered.
    bool has_pending() const;

    // Set when an unterminated line exceeded the cap; cleared by reset().
    bool overflowed() const { return overflowed_; }
    size_t max_line_bytes() const { return max_line_bytes_; }

private:
    // Returns false if the callback asked to stop.
    bool process_line(std::string line, const SSECallback& callback);

    std::string buffer_;
    std::optional<std::string> current_event_;
    std::string current_data_;
    bool has_data_ = false;
    size_t max_line_bytes_;
    bool overflowed_ = false;
};

} // namespace mcphost
