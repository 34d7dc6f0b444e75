#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERR:   return "ERROR";
    }
    return "?????";
}

} // namespace

std::optional<LogLevel> parse_level(const std::string& text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn") return LogLevel::WARN;
    if (text == "error") return LogLevel::ERR;
    return std::nullopt;
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return level_;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (level < level_) return;

    std::string line = timestamp() + " [" + level_name(level) + "] " + message + "\n";
    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << line << std::flush;
}

void debug(const std::string& message) { Logger::get().log(LogLevel::DEBUG, message); }
void info(const std::string& message)  { Logger::get().log(LogLevel::INFO, message); }
void warn(const std::string& message)  { Logger::get().log(LogLevel::WARN, message); }
void error(const std::string& message) { Logger::get().log(LogLevel::ERR, message); }

} // namespace logging
