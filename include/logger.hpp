#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERR = 3
};

// Parses "debug", "info", "warn" or "error".
std::optional<LogLevel> parse_level(const std::string& text);

class Logger {
public:
    static Logger& get();

    void set_level(LogLevel level);
    LogLevel level() const;

    // INFO and DEBUG go to stdout, WARN and ERR to stderr.
    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::INFO;
    mutable std::mutex mutex_;
};

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

} // namespace logging
