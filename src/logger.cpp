#include "logger.hpp"
#include "util.hpp"

#include <iostream>
#include <mutex>

namespace mcphost {

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return fallback;
}

void StderrLogger::log(LogLevel level, const std::string& tag, const std::string& message) {
    if (level < min_level_) return;

    static std::mutex mu; // one line at a time
    std::lock_guard<std::mutex> lock(mu);

    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::Warn) std::cerr << "Warning: ";
    else if (level == LogLevel::Error) std::cerr << "Error: ";
    std::cerr << message << "\n";
}

} // namespace mcphost
