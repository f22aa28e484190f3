/**
 * @file logger.cpp
 * @brief Thread-safe logging with optional rate limiting
 *
 * Features:
 * - Singleton pattern for global access
 * - Lock-free level checking
 * - Optional rate limiting (disabled when the limit is 0)
 * - Structured logging (JSON lines) or plain text
 * - Timestamp with millisecond precision (UTC)
 */

#include "bourse/logger.hpp"
#include <ctime>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace bourse {

bool parse_log_level(std::string_view name, LogLevel& level) {
    if (name == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (name == "INFO")  { level = LogLevel::INFO;  return true; }
    if (name == "WARN")  { level = LogLevel::WARN;  return true; }
    if (name == "ERROR") { level = LogLevel::ERROR; return true; }
    if (name == "FATAL") { level = LogLevel::FATAL; return true; }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_rate_limit(std::chrono::milliseconds limit) {
    rate_limit_ms_.store(limit.count());
}

void Logger::enable_structured(bool enabled) {
    structured_.store(enabled);
}

void Logger::set_sink(Sink sink) {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

/**
 * @brief Log message at specified level
 * @param level Log level (DEBUG, INFO, WARN, ERROR, FATAL)
 * @param message Message to log (already sanitized)
 *
 * Thread-safe: Multiple threads can log concurrently; output lines
 * are serialized by the sink mutex.
 */
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) return;

    if (should_rate_limit()) return;

    auto line = format_message(level, message);

    std::lock_guard lock(sink_mutex_);
    if (sink_) {
        sink_(line);
    } else {
        std::cerr << line << std::endl;
    }
}

/**
 * @brief Format log message with timestamp and level
 *
 * Formats:
 * - Structured (JSON): {"timestamp":"...","level":"...","message":"..."}
 * - Plain: [2024-01-01 12:00:00.123] INFO message
 */
std::string Logger::format_message(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;

    if (structured_.load()) {
        ss << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
           << ",\"level\":\"";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO"; break;
            case LogLevel::WARN:  ss << "WARN"; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << "\",\"message\":\"" << message << "\"}";
    } else {
        ss << "[" << std::put_time(&utc, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO "; break;
            case LogLevel::WARN:  ss << "WARN "; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << " " << message;
    }

    return ss.str();
}

// Drops the line when another one was emitted inside the rate limit window
bool Logger::should_rate_limit() {
    auto limit = rate_limit_ms_.load();
    if (limit <= 0) return false;

    auto now = std::chrono::steady_clock::now();
    auto last = last_log_.load();

    if (now - last < std::chrono::milliseconds(limit)) {
        return true;
    }

    last_log_.store(now);
    return false;
}

} // namespace bourse
