#pragma once

#include "bourse/config.hpp"
#include "bourse/error_handling.hpp"
#include "bourse/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace bourse {

// Field validators for order and admin inputs
class FieldValidators {
public:
    static Result<void> validate_quantity(Quantity quantity);

    // LIMIT requires a positive price; MARKET drops whatever was supplied
    static Result<std::optional<Price>> validate_price(OrderType type, std::optional<Price> price);

    // Upper-cases then validates; returns the normalized ticker
    static Result<std::string> validate_ticker(std::string_view ticker);

    static Result<void> validate_name(std::string_view name);
    static Result<void> validate_kind(std::string_view kind);
    static Result<void> validate_amount(Amount delta);
    static Result<void> validate_limit(size_t limit, size_t max);

    // quantity * price, or NOTIONAL_OVERFLOW
    static Result<Amount> notional(Quantity quantity, Price price);
};

// Configuration validator
class ConfigurationValidator {
public:
    static Result<void> validate_full_config(const Config& config);

private:
    static Result<void> validate_engine_config(const EngineConfig& config);
    static Result<void> validate_ledger_config(const LedgerConfig& config);
    static Result<void> validate_book_config(const BookConfig& config);
    static Result<void> validate_logging_config(const LoggingConfig& config);
};

} // namespace bourse
