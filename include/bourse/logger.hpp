#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <atomic>
#include <mutex>
#include <functional>
#include "bourse/security_utils.hpp"

namespace bourse {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

bool parse_log_level(std::string_view name, LogLevel& level);

class Logger {
public:
    using Sink = std::function<void(const std::string&)>;

    static Logger& instance();

    void set_level(LogLevel level);
    void set_rate_limit(std::chrono::milliseconds limit);
    void enable_structured(bool enabled);

    // Replaces the output stream (stderr by default); an empty sink restores it
    void set_sink(Sink sink);

    bool should_log(LogLevel level) const { return level >= level_.load(); }

    void log(LogLevel level, const std::string& message);

    // Type-safe logging with automatic sanitization
    template<typename... Args>
    void log_safe(LogLevel level, std::string_view format_str, const Args&... args) {
        auto formatted = SecurityUtils::safe_format(format_str, args...);
        auto sanitized = SecurityUtils::sanitize_log_input(formatted);
        log(level, sanitized);
    }

    // Convenience methods with sanitization
    void debug(const std::string& msg) { log(LogLevel::DEBUG, SecurityUtils::sanitize_log_input(msg)); }
    void info(const std::string& msg) { log(LogLevel::INFO, SecurityUtils::sanitize_log_input(msg)); }
    void warn(const std::string& msg) { log(LogLevel::WARN, SecurityUtils::sanitize_log_input(msg)); }
    void error(const std::string& msg) { log(LogLevel::ERROR, SecurityUtils::sanitize_log_input(msg)); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, SecurityUtils::sanitize_log_input(msg)); }

    template<typename... Args>
    void debug_safe(std::string_view fmt, const Args&... args) { log_safe(LogLevel::DEBUG, fmt, args...); }
    template<typename... Args>
    void info_safe(std::string_view fmt, const Args&... args) { log_safe(LogLevel::INFO, fmt, args...); }
    template<typename... Args>
    void warn_safe(std::string_view fmt, const Args&... args) { log_safe(LogLevel::WARN, fmt, args...); }
    template<typename... Args>
    void error_safe(std::string_view fmt, const Args&... args) { log_safe(LogLevel::ERROR, fmt, args...); }
    template<typename... Args>
    void fatal_safe(std::string_view fmt, const Args&... args) { log_safe(LogLevel::FATAL, fmt, args...); }

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> structured_{false};
    std::atomic<long long> rate_limit_ms_{0};
    std::atomic<std::chrono::steady_clock::time_point> last_log_{};

    std::mutex sink_mutex_;
    Sink sink_;

    std::string format_message(LogLevel level, const std::string& message);
    bool should_rate_limit();
};

// Secure logging macros
#define LOG_DEBUG(msg) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::DEBUG)) bourse::Logger::instance().debug(msg); } while (0)
#define LOG_INFO(msg) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::INFO)) bourse::Logger::instance().info(msg); } while (0)
#define LOG_WARN(msg) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::WARN)) bourse::Logger::instance().warn(msg); } while (0)
#define LOG_ERROR(msg) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::ERROR)) bourse::Logger::instance().error(msg); } while (0)
#define LOG_FATAL(msg) bourse::Logger::instance().fatal(msg)

// Type-safe logging macros
#define LOG_DEBUG_SAFE(fmt, ...) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::DEBUG)) bourse::Logger::instance().debug_safe(fmt, __VA_ARGS__); } while (0)
#define LOG_INFO_SAFE(fmt, ...) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::INFO)) bourse::Logger::instance().info_safe(fmt, __VA_ARGS__); } while (0)
#define LOG_WARN_SAFE(fmt, ...) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::WARN)) bourse::Logger::instance().warn_safe(fmt, __VA_ARGS__); } while (0)
#define LOG_ERROR_SAFE(fmt, ...) do { if (bourse::Logger::instance().should_log(bourse::LogLevel::ERROR)) bourse::Logger::instance().error_safe(fmt, __VA_ARGS__); } while (0)
#define LOG_FATAL_SAFE(fmt, ...) bourse::Logger::instance().fatal_safe(fmt, __VA_ARGS__)

} // namespace bourse
