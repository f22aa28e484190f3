/**
 * @file risk_manager.cpp
 * @brief Pre-trade validation and balance sufficiency
 *
 * Checks, in order:
 * - Instrument listed (after upper-casing the ticker)
 * - User registered
 * - Quantity positive, LIMIT price positive
 * - Balance covers the order: BUY needs quantity x effective price of the
 *   quote currency, SELL needs quantity of the asset
 *
 * The instrument and user checks are repeated by confirm_parties() after
 * the settlement gate is taken, since a deletion may land in between.
 *
 * An unpriced MARKET BUY is costed at the configured reference price. The
 * true cost is only known while matching, where each fill is capped by what
 * the buyer can still pay.
 */

#include "bourse/risk_manager.hpp"
#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include "bourse/security_utils.hpp"

namespace bourse {

RiskManager::RiskManager(const EngineConfig& config, const InstrumentRegistry& instruments,
                         const UserRegistry& users, const Ledger& ledger)
    : config_(config), instruments_(instruments), users_(users), ledger_(ledger) {}

ErrorCode RiskManager::reject(const OrderRequest& request, ErrorCode code) const {
    orders_rejected_.fetch_add(1);
    LOG_WARN_SAFE("Order rejected for user {} on {}: {}", request.user_id, request.ticker,
                  make_error_code(code).message());
    return code;
}

Result<OrderRequest> RiskManager::validate_new_order(const OrderRequest& request) const {
    orders_checked_.fetch_add(1);

    OrderRequest normalized = request;
    normalized.ticker = SecurityUtils::normalize_ticker(request.ticker);

    if (!instruments_.exists(normalized.ticker)) {
        return reject(normalized, ErrorCode::INSTRUMENT_NOT_FOUND);
    }

    if (!users_.exists(normalized.user_id)) {
        return reject(normalized, ErrorCode::USER_NOT_FOUND);
    }

    if (FieldValidators::validate_quantity(normalized.quantity).has_error()) {
        return reject(normalized, ErrorCode::INVALID_QUANTITY);
    }

    auto price = FieldValidators::validate_price(normalized.type, normalized.price);
    if (price.has_error()) {
        return reject(normalized, ErrorCode::INVALID_PRICE);
    }
    normalized.price = price.value();

    return normalized;
}

Result<Amount> RiskManager::required_balance(const OrderRequest& request) const {
    if (request.side == Side::SELL) {
        return request.quantity;
    }

    Price effective_price = request.price.value_or(config_.market_buy_reference_price);
    return FieldValidators::notional(request.quantity, effective_price);
}

Result<void> RiskManager::check_affordability(const OrderRequest& request) const {
    auto required = required_balance(request);
    if (required.has_error()) {
        return reject(request, ErrorCode::NOTIONAL_OVERFLOW);
    }

    const std::string& ticker = request.side == Side::BUY ? config_.quote_currency : request.ticker;
    if (!ledger_.has_at_least(request.user_id, ticker, required.value())) {
        return reject(request, ErrorCode::INSUFFICIENT_FUNDS);
    }

    return Result<void>();
}

Result<void> RiskManager::confirm_parties(const Order& order) const {
    if (!instruments_.exists(order.ticker)) {
        orders_rejected_.fetch_add(1);
        LOG_WARN_SAFE("Order {} dropped: instrument {} was delisted", order.id, order.ticker);
        return ErrorCode::INSTRUMENT_NOT_FOUND;
    }

    if (!users_.exists(order.user_id)) {
        orders_rejected_.fetch_add(1);
        LOG_WARN_SAFE("Order {} dropped: user {} was deleted", order.id, order.user_id);
        return ErrorCode::USER_NOT_FOUND;
    }

    return Result<void>();
}

Result<void> RiskManager::validate_cancel(const Order& order, const UserID& user_id) const {
    // Someone else's order is reported as absent
    if (order.user_id != user_id) {
        return ErrorCode::ORDER_NOT_FOUND;
    }

    if (order.type != OrderType::LIMIT || order.is_terminal() || order.remaining() <= 0) {
        LOG_WARN_SAFE("Order {} cannot be cancelled in status {}", order.id, to_string(order.status));
        return ErrorCode::ORDER_NOT_CANCELLABLE;
    }

    return Result<void>();
}

} // namespace bourse
