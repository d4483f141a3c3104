#pragma once
#include <string>

namespace mcphost {

enum class LogLevel { Debug, Info, Warn, Error };

// "debug", "info", "warn"/"warning", "error"; anything else yields fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

// Injectable diagnostics sink. Components log through this instead of
// writing to the console so they can be exercised without capturing output.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(LogLevel level, const std::string& tag, const std::string& message) = 0;

    void debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
    void info(const std::string& tag, const std::string& message)  { log(LogLevel::Info, tag, message); }
    void warn(const std::string& tag, const std::string& message)  { log(LogLevel::Warn, tag, message); }
    void error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }
};

// Writes "[tag] message" lines to stderr.
class StderrLogger : public Logger {
public:
    explicit StderrLogger(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

    void log(LogLevel level, const std::string& tag, const std::string& message) override;

    void set_min_level(LogLevel level) { min_level_ = level; }

private:
    LogLevel min_level_;
};

} // namespace mcphost
