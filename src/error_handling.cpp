#include "bourse/error_handling.hpp"
#include "bourse/logger.hpp"
#include <thread>

namespace bourse {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS: return "Success";

        case ErrorCode::INSTRUMENT_NOT_FOUND: return "Instrument not found";
        case ErrorCode::ORDER_NOT_FOUND: return "Order not found";
        case ErrorCode::USER_NOT_FOUND: return "User not found";

        case ErrorCode::INVALID_QUANTITY: return "Quantity must be a positive integer";
        case ErrorCode::INVALID_PRICE: return "Price must be a positive number for LIMIT orders";
        case ErrorCode::INVALID_TICKER: return "Invalid ticker";
        case ErrorCode::INVALID_IDENTIFIER: return "Malformed identifier";
        case ErrorCode::INVALID_AMOUNT: return "Invalid amount";
        case ErrorCode::INVALID_LIMIT: return "Limit out of range";
        case ErrorCode::INVALID_NAME: return "Invalid name";
        case ErrorCode::INVALID_CONFIGURATION: return "Invalid configuration";
        case ErrorCode::NOTIONAL_OVERFLOW: return "Order notional overflows";

        case ErrorCode::INSUFFICIENT_FUNDS: return "Insufficient balance";

        case ErrorCode::ORDER_NOT_CANCELLABLE: return "Order cannot be cancelled in its current state";
        case ErrorCode::ORDER_DUPLICATE: return "Duplicate order";
        case ErrorCode::INSTRUMENT_EXISTS: return "Instrument already exists";

        case ErrorCode::STORE_TRANSIENT_CONFLICT: return "Transient store write conflict";
        case ErrorCode::STORE_RETRIES_EXHAUSTED: return "Store write retries exhausted";

        case ErrorCode::GATE_NOT_HELD: return "Settlement gate not held";
        case ErrorCode::ENTROPY_UNAVAILABLE: return "Secure random generation failed";
        case ErrorCode::SYSTEM_CORRUPTED_STATE: return "System corrupted state";

        default: return "Unknown error";
    }
}

const ErrorCategory& error_category() {
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return {static_cast<int>(ec), error_category()};
}

ErrorKind error_kind(const std::error_code& ec) {
    if (!ec) return ErrorKind::NONE;
    if (ec.category() != error_category()) return ErrorKind::INTERNAL;

    int value = ec.value();
    if (value >= 1000 && value < 2000) return ErrorKind::NOT_FOUND;
    if (value >= 2000 && value < 3000) return ErrorKind::INVALID_INPUT;
    if (value >= 3000 && value < 4000) return ErrorKind::INSUFFICIENT_FUNDS;
    if (value >= 4000 && value < 5000) return ErrorKind::CONFLICT;
    if (value >= 5000 && value < 6000) return ErrorKind::TRANSIENT_STORE_CONFLICT;
    return ErrorKind::INTERNAL;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::NOT_FOUND: return "NotFound";
        case ErrorKind::INVALID_INPUT: return "InvalidInput";
        case ErrorKind::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case ErrorKind::CONFLICT: return "Conflict";
        case ErrorKind::TRANSIENT_STORE_CONFLICT: return "TransientStoreConflict";
        case ErrorKind::INTERNAL: return "Internal";
    }
    return "Unknown";
}

// RetryPolicy implementation
RetryPolicy::RetryPolicy(int max_attempts, std::chrono::milliseconds backoff_min,
                         std::chrono::milliseconds backoff_max)
    : max_attempts_(max_attempts < 1 ? 1 : max_attempts),
      backoff_min_(backoff_min), backoff_max_(backoff_max),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }),
      rng_(std::random_device{}()) {
    if (backoff_max_ < backoff_min_) {
        backoff_max_ = backoff_min_;
    }
}

RetryPolicy::RetryPolicy(const RetryPolicy& other)
    : max_attempts_(other.max_attempts_), backoff_min_(other.backoff_min_),
      backoff_max_(other.backoff_max_), sleeper_(other.sleeper_),
      rng_(std::random_device{}()) {}

RetryPolicy& RetryPolicy::operator=(const RetryPolicy& other) {
    if (this != &other) {
        max_attempts_ = other.max_attempts_;
        backoff_min_ = other.backoff_min_;
        backoff_max_ = other.backoff_max_;
        sleeper_ = other.sleeper_;
    }
    return *this;
}

/**
 * @brief Randomized backoff scaled by 2^attempt
 * @param attempt Zero-based index of the attempt that just failed
 * @return Delay drawn uniformly from [min, max] then doubled per attempt
 */
std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) {
    std::uniform_int_distribution<long long> dist(backoff_min_.count(), backoff_max_.count());
    long long base;
    {
        std::lock_guard lock(rng_mutex_);
        base = dist(rng_);
    }
    return std::chrono::milliseconds(base << attempt);
}

void RetryPolicy::report_retry(const ErrorContext& context, int attempt,
                               std::chrono::milliseconds delay) const {
    LOG_WARN_SAFE("{} {}: transient conflict on attempt {}/{}, retrying in {}ms",
                  context.component, context.operation, attempt, max_attempts_, delay.count());
}

void RetryPolicy::report_exhausted(const ErrorContext& context, int attempts) const {
    LOG_ERROR_SAFE("{} {}: giving up after {} attempts ({})",
                   context.component, context.operation, attempts, context.details);
}

} // namespace bourse
