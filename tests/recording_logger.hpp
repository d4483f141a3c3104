#pragma once
#include "logger.hpp"
#include <string>
#include <vector>

namespace mcphost {

class RecordingLogger : public Logger {
public:
    struct Entry {
        LogLevel level;
        std::string tag;
        std::string message;
    };
    std::vector<Entry> entries;

    void log(LogLevel level, const std::string& tag, const std::string& message) override {
        entries.push_back({level, tag, message});
    }

    bool contains(const std::string& needle) const {
        for (const auto& e : entries)
            if (e.message.find(needle) != std::string::npos) return true;
        return false;
    }

    size_t count(LogLevel level) const {
        size_t n = 0;
        for (const auto& e : entries)
            if (e.level == level) n++;
        return n;
    }
};

} // namespace mcphost
