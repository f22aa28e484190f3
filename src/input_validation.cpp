#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include "bourse/security_utils.hpp"
#include <algorithm>

namespace bourse {

// FieldValidators implementation
Result<void> FieldValidators::validate_quantity(Quantity quantity) {
    if (quantity <= 0) {
        return ErrorCode::INVALID_QUANTITY;
    }
    return Result<void>();
}

Result<std::optional<Price>> FieldValidators::validate_price(OrderType type, std::optional<Price> price) {
    if (type == OrderType::MARKET) {
        return std::optional<Price>{};
    }
    if (!price.has_value() || *price <= 0) {
        return ErrorCode::INVALID_PRICE;
    }
    return price;
}

Result<std::string> FieldValidators::validate_ticker(std::string_view ticker) {
    auto normalized = SecurityUtils::normalize_ticker(ticker);
    if (!SecurityUtils::is_valid_ticker(normalized)) {
        LOG_DEBUG_SAFE("Rejected ticker: {}", normalized);
        return ErrorCode::INVALID_TICKER;
    }
    return normalized;
}

Result<void> FieldValidators::validate_name(std::string_view name) {
    if (!SecurityUtils::is_safe_string(name)) {
        return ErrorCode::INVALID_NAME;
    }
    return Result<void>();
}

Result<void> FieldValidators::validate_kind(std::string_view kind) {
    if (!SecurityUtils::is_safe_string(kind)) {
        return ErrorCode::INVALID_NAME;
    }
    return Result<void>();
}

Result<void> FieldValidators::validate_amount(Amount delta) {
    if (delta == 0) {
        return ErrorCode::INVALID_AMOUNT;
    }
    return Result<void>();
}

Result<void> FieldValidators::validate_limit(size_t limit, size_t max) {
    if (limit == 0 || limit > max) {
        return ErrorCode::INVALID_LIMIT;
    }
    return Result<void>();
}

Result<Amount> FieldValidators::notional(Quantity quantity, Price price) {
    Amount total = 0;
    if (__builtin_mul_overflow(quantity, price, &total)) {
        return ErrorCode::NOTIONAL_OVERFLOW;
    }
    return total;
}

// ConfigurationValidator implementation
Result<void> ConfigurationValidator::validate_full_config(const Config& config) {
    auto result = validate_engine_config(config.engine);
    if (result.has_error()) return result;

    result = validate_ledger_config(config.ledger);
    if (result.has_error()) return result;

    result = validate_book_config(config.book);
    if (result.has_error()) return result;

    return validate_logging_config(config.logging);
}

Result<void> ConfigurationValidator::validate_engine_config(const EngineConfig& config) {
    auto quote = SecurityUtils::normalize_ticker(config.quote_currency);
    if (quote != config.quote_currency || !SecurityUtils::is_valid_ticker(quote)) {
        LOG_ERROR_SAFE("Invalid quote currency: {}", config.quote_currency);
        return ErrorCode::INVALID_CONFIGURATION;
    }

    if (config.market_buy_reference_price <= 0) {
        LOG_ERROR("Market buy reference price must be positive");
        return ErrorCode::INVALID_CONFIGURATION;
    }

    for (const auto& ticker : config.instrument_list()) {
        if (!SecurityUtils::is_valid_ticker(ticker)) {
            LOG_ERROR_SAFE("Invalid default instrument: {}", ticker);
            return ErrorCode::INVALID_CONFIGURATION;
        }
    }

    return Result<void>();
}

Result<void> ConfigurationValidator::validate_ledger_config(const LedgerConfig& config) {
    if (config.max_attempts == 0 || config.max_attempts > 10) {
        LOG_ERROR("Ledger max_attempts must be within 1..10");
        return ErrorCode::INVALID_CONFIGURATION;
    }

    if (config.backoff_min_ms > config.backoff_max_ms) {
        LOG_ERROR("Ledger backoff_min_ms exceeds backoff_max_ms");
        return ErrorCode::INVALID_CONFIGURATION;
    }

    return Result<void>();
}

Result<void> ConfigurationValidator::validate_book_config(const BookConfig& config) {
    if (config.max_depth == 0 || config.default_depth == 0 ||
        config.default_depth > config.max_depth) {
        LOG_ERROR("Book depth settings are inconsistent");
        return ErrorCode::INVALID_CONFIGURATION;
    }

    if (config.max_trade_limit == 0 || config.default_trade_limit == 0 ||
        config.default_trade_limit > config.max_trade_limit) {
        LOG_ERROR("Trade limit settings are inconsistent");
        return ErrorCode::INVALID_CONFIGURATION;
    }

    return Result<void>();
}

Result<void> ConfigurationValidator::validate_logging_config(const LoggingConfig& config) {
    LogLevel level;
    if (!parse_log_level(config.level, level)) {
        LOG_ERROR_SAFE("Unknown log level: {}", config.level);
        return ErrorCode::INVALID_CONFIGURATION;
    }
    return Result<void>();
}

} // namespace bourse
