#pragma once

#include <system_error>
#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>

namespace bourse {

// Unified error codes
enum class ErrorCode {
    SUCCESS = 0,

    // Lookup errors
    INSTRUMENT_NOT_FOUND = 1000,
    ORDER_NOT_FOUND,
    USER_NOT_FOUND,

    // Input validation errors
    INVALID_QUANTITY = 2000,
    INVALID_PRICE,
    INVALID_TICKER,
    INVALID_IDENTIFIER,
    INVALID_AMOUNT,
    INVALID_LIMIT,
    INVALID_NAME,
    INVALID_CONFIGURATION,
    NOTIONAL_OVERFLOW,

    // Funds errors
    INSUFFICIENT_FUNDS = 3000,

    // State conflicts
    ORDER_NOT_CANCELLABLE = 4000,
    ORDER_DUPLICATE,
    INSTRUMENT_EXISTS,

    // Store errors
    STORE_TRANSIENT_CONFLICT = 5000,
    STORE_RETRIES_EXHAUSTED,

    // System errors
    GATE_NOT_HELD = 6000,
    ENTROPY_UNAVAILABLE,
    SYSTEM_CORRUPTED_STATE
};

// Caller-facing classification of error codes
enum class ErrorKind {
    NONE,
    NOT_FOUND,
    INVALID_INPUT,
    INSUFFICIENT_FUNDS,
    CONFLICT,
    TRANSIENT_STORE_CONFLICT,
    INTERNAL
};

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "bourse"; }
    std::string message(int ev) const override;
};

const ErrorCategory& error_category();
std::error_code make_error_code(ErrorCode ec);

ErrorKind error_kind(const std::error_code& ec);
const char* to_string(ErrorKind kind);

// Value-or-error return for error propagation
template<typename T>
class Result {
public:
    Result(T&& value) : value_(std::move(value)), has_value_(true) {}
    Result(const T& value) : value_(value), has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }

    const T& value() const& {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return value_;
    }

    T&& value() && {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return std::move(value_);
    }

    const std::error_code& error() const { return error_; }
    ErrorKind kind() const { return error_kind(error_); }

private:
    T value_{};
    std::error_code error_;
    bool has_value_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }
    const std::error_code& error() const { return error_; }
    ErrorKind kind() const { return error_kind(error_); }

private:
    std::error_code error_;
    bool has_value_;
};

// Error context for detailed error information
struct ErrorContext {
    std::string component;
    std::string operation;
    std::string details;
    std::chrono::steady_clock::time_point timestamp;

    ErrorContext(std::string comp, std::string op, std::string det = "")
        : component(std::move(comp)), operation(std::move(op)),
          details(std::move(det)), timestamp(std::chrono::steady_clock::now()) {}
};

// Bounded retry with randomized exponential backoff.
// Only STORE_TRANSIENT_CONFLICT is retried; any other outcome is returned as is.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(int max_attempts = 3,
                         std::chrono::milliseconds backoff_min = std::chrono::milliseconds(10),
                         std::chrono::milliseconds backoff_max = std::chrono::milliseconds(100));

    RetryPolicy(const RetryPolicy& other);
    RetryPolicy& operator=(const RetryPolicy& other);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    int max_attempts() const { return max_attempts_; }

    // Delay before the retry that follows failed attempt `attempt` (0-based)
    std::chrono::milliseconds backoff_for(int attempt);

    template<typename F>
    auto run(const ErrorContext& context, F&& operation) -> decltype(operation()) {
        for (int attempt = 0;; ++attempt) {
            auto result = operation();
            if (!result.has_error() ||
                result.error() != make_error_code(ErrorCode::STORE_TRANSIENT_CONFLICT)) {
                return result;
            }
            if (attempt + 1 >= max_attempts_) {
                report_exhausted(context, attempt + 1);
                return decltype(operation())(ErrorCode::STORE_RETRIES_EXHAUSTED);
            }
            auto delay = backoff_for(attempt);
            report_retry(context, attempt + 1, delay);
            sleeper_(delay);
        }
    }

private:
    int max_attempts_;
    std::chrono::milliseconds backoff_min_;
    std::chrono::milliseconds backoff_max_;
    Sleeper sleeper_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;

    void report_retry(const ErrorContext& context, int attempt, std::chrono::milliseconds delay) const;
    void report_exhausted(const ErrorContext& context, int attempts) const;
};

} // namespace bourse

// Make ErrorCode compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<bourse::ErrorCode> : true_type {};
}
