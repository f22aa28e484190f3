/**
 * @file exchange.cpp
 * @brief Exchange facade - owns the stores and coordinates admin and trading calls
 *
 * Construction order:
 * 1. Logging (level, rate limit, structured output from config)
 * 2. Ledger (store plus retry policy, bound to the settlement gate)
 * 3. Default instruments (quote currency always listed)
 * 4. Risk manager and matching engine
 *
 * Every mutation of balances or order state happens under the exclusive
 * settlement gate. Reads that must not observe a half-applied settlement
 * (balances, orders) take the shared mode.
 */

#include "bourse/exchange.hpp"
#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include "bourse/security_utils.hpp"
#include <unordered_set>

namespace bourse {

Exchange::Exchange(std::unique_ptr<Config> config, std::unique_ptr<LedgerStore> store)
    : config_(config ? std::move(config) : Config::defaults()), store_(std::move(store)) {

    initialize_logging();
    initialize_ledger();
    initialize_instruments();
    initialize_engine();
}

Exchange::~Exchange() {
    LOG_DEBUG_SAFE("Exchange shut down with {} orders and {} trades", orders_.size(), trades_.size());
}

void Exchange::initialize_logging() {
    auto& logger = Logger::instance();
    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config_->logging.level, level)) {
        logger.set_level(level);
    }
    logger.set_rate_limit(std::chrono::milliseconds(config_->logging.rate_limit_ms));
    logger.enable_structured(config_->logging.enable_structured);
}

void Exchange::initialize_ledger() {
    if (!store_) {
        store_ = std::make_unique<InMemoryLedgerStore>();
    }

    RetryPolicy retry(static_cast<int>(config_->ledger.max_attempts),
                      std::chrono::milliseconds(config_->ledger.backoff_min_ms),
                      std::chrono::milliseconds(config_->ledger.backoff_max_ms));
    ledger_ = std::make_unique<Ledger>(*store_, gate_, retry);
}

void Exchange::initialize_instruments() {
    auto tickers = config_->engine.instrument_list();
    tickers.insert(tickers.begin(), config_->engine.quote_currency);

    for (const auto& ticker : tickers) {
        if (instruments_.exists(SecurityUtils::normalize_ticker(ticker))) continue;
        auto added = instruments_.add(ticker, "CURRENCY");
        if (added.has_error()) {
            LOG_ERROR_SAFE("Failed to list default instrument {}: {}", ticker, added.error().message());
        }
    }
}

void Exchange::initialize_engine() {
    risk_manager_ = std::make_unique<RiskManager>(config_->engine, instruments_, users_, *ledger_);
    matching_engine_ = std::make_unique<MatchingEngine>(config_->engine, gate_, *ledger_,
                                                        orders_, trades_, *risk_manager_);
    LOG_INFO_SAFE("Exchange ready: quote currency {}, {} instruments",
                  config_->engine.quote_currency, instruments_.list().size());
}

Result<std::string> Exchange::resolve_ticker(std::string_view ticker) const {
    auto normalized = SecurityUtils::normalize_ticker(ticker);
    if (!instruments_.exists(normalized)) {
        return ErrorCode::INSTRUMENT_NOT_FOUND;
    }
    return normalized;
}

// Users

Result<User> Exchange::register_user(std::string_view name) {
    return users_.create(name);
}

Result<void> Exchange::delete_user(const UserID& user_id) {
    auto lock = gate_.exclusive();

    if (!users_.exists(user_id)) {
        return ErrorCode::USER_NOT_FOUND;
    }

    auto removed = orders_.erase_user(user_id);
    std::unordered_set<OrderID> order_ids(removed.begin(), removed.end());
    size_t trade_count = trades_.erase_orders(order_ids);
    size_t balance_count = ledger_->erase_user(user_id);

    auto result = users_.remove(user_id);
    LOG_INFO_SAFE("User {} deleted with {} orders, {} trades, {} balances",
                  user_id, removed.size(), trade_count, balance_count);
    return result;
}

// Instruments

Result<Instrument> Exchange::add_instrument(std::string_view ticker, std::string_view kind) {
    return instruments_.add(ticker, kind);
}

Result<void> Exchange::delete_instrument(std::string_view ticker) {
    auto normalized = SecurityUtils::normalize_ticker(ticker);
    if (normalized == config_->engine.quote_currency) {
        LOG_WARN_SAFE("Refusing to delete quote currency {}", normalized);
        return ErrorCode::INVALID_TICKER;
    }

    auto lock = gate_.exclusive();

    if (!instruments_.exists(normalized)) {
        return ErrorCode::INSTRUMENT_NOT_FOUND;
    }

    size_t balance_count = ledger_->erase_ticker(normalized);
    auto removed = orders_.erase_ticker(normalized);
    size_t trade_count = trades_.erase_ticker(normalized);

    auto result = instruments_.remove(normalized);
    LOG_INFO_SAFE("Instrument {} deleted with {} orders, {} trades, {} balances",
                  normalized, removed.size(), trade_count, balance_count);
    return result;
}

// Trading

Result<Order> Exchange::submit_order(const OrderRequest& request) {
    return matching_engine_->submit_order(request);
}

Result<Order> Exchange::cancel_order(const OrderID& order_id, const UserID& user_id) {
    return matching_engine_->cancel_order(order_id, user_id);
}

OrderReport Exchange::make_report(const Order& order) const {
    OrderReport report;
    report.order = order;
    report.remaining_quantity = order.remaining();
    report.average_execution_price = trades_.average_price(order.id);
    return report;
}

Result<OrderReport> Exchange::get_order(const OrderID& order_id, const UserID& user_id) const {
    auto lock = gate_.shared();

    auto order = orders_.find(order_id);
    if (!order || order->user_id != user_id) {
        return ErrorCode::ORDER_NOT_FOUND;
    }
    return make_report(*order);
}

Result<std::vector<OrderReport>> Exchange::list_orders(const UserID& user_id) const {
    auto lock = gate_.shared();

    if (!users_.exists(user_id)) {
        return ErrorCode::USER_NOT_FOUND;
    }

    std::vector<OrderReport> reports;
    for (const auto& order : orders_.orders_of(user_id)) {
        reports.push_back(make_report(order));
    }
    return reports;
}

// Market data

Result<BookSnapshot> Exchange::get_book(std::string_view ticker, std::optional<size_t> depth) const {
    size_t levels = depth.value_or(config_->book.default_depth);
    auto valid = FieldValidators::validate_limit(levels, config_->book.max_depth);
    if (valid.has_error()) {
        return valid.error();
    }

    auto resolved = resolve_ticker(ticker);
    if (resolved.has_error()) {
        return resolved.error();
    }
    return orders_.book(resolved.value(), levels);
}

Result<std::vector<Trade>> Exchange::get_recent_trades(std::string_view ticker, std::optional<size_t> limit) const {
    size_t count = limit.value_or(config_->book.default_trade_limit);
    auto valid = FieldValidators::validate_limit(count, config_->book.max_trade_limit);
    if (valid.has_error()) {
        return valid.error();
    }

    auto resolved = resolve_ticker(ticker);
    if (resolved.has_error()) {
        return resolved.error();
    }
    return trades_.recent(resolved.value(), count);
}

// Balances

Result<Amount> Exchange::adjust_balance(const UserID& user_id, std::string_view ticker, Amount delta) {
    auto valid = FieldValidators::validate_amount(delta);
    if (valid.has_error()) {
        return valid.error();
    }

    // Checked under the gate: a concurrent delete must not leave a row behind
    auto lock = gate_.exclusive();

    if (!users_.exists(user_id)) {
        return ErrorCode::USER_NOT_FOUND;
    }

    auto resolved = resolve_ticker(ticker);
    if (resolved.has_error()) {
        return resolved.error();
    }

    auto result = ledger_->apply_delta(BalanceKey{user_id, resolved.value()}, delta);
    if (result.has_error()) {
        LOG_WARN_SAFE("Balance adjustment {} on {}/{} refused: {}", delta, user_id,
                      resolved.value(), result.error().message());
        return result;
    }

    LOG_INFO_SAFE("Balance {}/{} adjusted by {} to {}", user_id, resolved.value(), delta, result.value());
    return result;
}

Result<std::map<std::string, Amount>> Exchange::get_balances(const UserID& user_id) const {
    auto lock = gate_.shared();

    if (!users_.exists(user_id)) {
        return ErrorCode::USER_NOT_FOUND;
    }
    return ledger_->balances(user_id);
}

} // namespace bourse
