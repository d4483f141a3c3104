#include "sse.hpp"

namespace mcphost {

bool SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    return feed(chunk.data(), chunk.size(), callback);
}

bool SSEParser::feed(const char* data, size_t len, const SSECallback& callback) {
    if (overflowed_) return false;
    buffer_.append(data, len);

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        pos = newline + 1;

        if (!process_line(std::move(line), callback)) {
            buffer_.erase(0, pos);
            return false;
        }
    }

    buffer_.erase(0, pos);
    if (buffer_.size() > max_line_bytes_) {
        overflowed_ = true;
        buffer_.clear();
        return false;
    }
    return true;
}

bool SSEParser::process_line(std::string line, const SSECallback& callback) {
    // Remove trailing \r if present
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Empty line = dispatch event
        bool keep_going = true;
        if (has_data_) {
            SSEEvent event{current_event_, current_data_};
            keep_going = callback(event);
        }
        current_event_.reset();
        current_data_.clear();
        has_data_ = false;
        return keep_going;
    }

    if (line[0] == ':') return true; // comment

    auto colon = line.find(':');
    std::string field = line.substr(0, colon);
    std::string value;
    if (colon != std::string::npos) {
        // Strip one optional space after the colon
        size_t start = colon + 1;
        if (start < line.size() && line[start] == ' ') ++start;
        value = line.substr(start);
    }

    if (field == "data") {
        if (has_data_) current_data_ += '\n';
        current_data_ += value;
        has_data_ = true;
    } else if (field == "event") {
        current_event_ = value;
    }
    // id:, retry: and unknown fields are ignored
    return true;
}

void SSEParser::finish() {
    reset();
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.reset();
    current_data_.clear();
    has_data_ = false;
    overflowed_ = false;
}

bool SSEParser::has_pending() const {
    return !buffer_.empty() || has_data_ || current_event_.has_value();
}

} // namespace mcphost
