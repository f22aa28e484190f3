/**
 * @file matching_engine.cpp
 * @brief Order submission, price/time matching and settlement
 *
 * Submission runs in three phases:
 * 1. Validation and affordability (outside the settlement gate, read-only)
 * 2. Under the gate: confirm the user and instrument still exist, persist
 *    the order, plan the fills against a projected ledger, then apply the
 *    plan through one Transaction
 * 3. Commit, or roll the whole submission back (order row included)
 *
 * Execution price is always the maker's price. Each fill is capped by what
 * the buyer can still pay and what the seller can still deliver, so a
 * settlement never drives a balance below zero. A maker whose owner cannot
 * cover its remainder is cancelled in the same transaction, and a LIMIT
 * taker that runs out of funds is cancelled instead of resting, so the
 * book is never left crossed.
 */

#include "bourse/matching_engine.hpp"
#include "bourse/logger.hpp"
#include "bourse/transaction.hpp"
#include <algorithm>

namespace bourse {

MatchingEngine::MatchingEngine(const EngineConfig& config, SettlementGate& gate, Ledger& ledger,
                               OrderStore& orders, TradeLog& trades, RiskManager& risk)
    : config_(config), gate_(gate), ledger_(ledger), orders_(orders), trades_(trades), risk_(risk) {}

Result<Order> MatchingEngine::build_order(const OrderRequest& request) {
    auto id = Uuid::generate();
    if (id.has_error()) {
        return id.error();
    }

    Order order;
    order.id = id.value();
    order.user_id = request.user_id;
    order.ticker = request.ticker;
    order.side = request.side;
    order.type = request.type;
    order.price = request.price;
    order.quantity = request.quantity;
    order.filled_quantity = 0;
    order.status = OrderStatus::NEW;
    order.created_at = std::chrono::system_clock::now();
    order.sequence = orders_.next_sequence();
    return order;
}

Result<Order> MatchingEngine::submit_order(const OrderRequest& request) {
    auto validated = risk_.validate_new_order(request);
    if (validated.has_error()) {
        orders_rejected_.fetch_add(1);
        return validated.error();
    }

    auto affordable = risk_.check_affordability(validated.value());
    if (affordable.has_error()) {
        orders_rejected_.fetch_add(1);
        return affordable.error();
    }

    auto built = build_order(validated.value());
    if (built.has_error()) {
        orders_rejected_.fetch_add(1);
        return built.error();
    }
    const Order& order = built.value();

    auto lock = gate_.exclusive();

    auto parties = risk_.confirm_parties(order);
    if (parties.has_error()) {
        orders_rejected_.fetch_add(1);
        return parties.error();
    }

    Transaction tx("submit_" + order.id.to_string());

    auto inserted = tx.apply(std::make_unique<InsertOrderAction>(orders_, order));
    if (inserted.has_error()) {
        orders_rejected_.fetch_add(1);
        return inserted.error();
    }

    MatchPlan plan = plan_matches(order);

    for (const auto& [before, after] : plan.maker_updates) {
        tx.add_action(std::make_unique<UpdateOrderAction>(orders_, before, after));
    }
    for (const auto& trade : plan.trades) {
        tx.add_action(std::make_unique<AppendTradeAction>(trades_, trade));
    }
    if (plan.taker.status != order.status || plan.taker.filled_quantity != order.filled_quantity) {
        tx.add_action(std::make_unique<UpdateOrderAction>(orders_, order, plan.taker));
    }
    for (const auto& [key, delta] : plan.deltas) {
        if (delta != 0) {
            tx.add_action(std::make_unique<BalanceDeltaAction>(ledger_, key, delta));
        }
    }

    auto committed = tx.commit();
    if (committed.has_error()) {
        rollbacks_.fetch_add(1);
        LOG_ERROR_SAFE("Settlement of order {} failed and was rolled back: {}",
                       order.id, committed.error().message());
        return committed.error();
    }

    orders_accepted_.fetch_add(1);
    trades_executed_.fetch_add(plan.trades.size());
    LOG_INFO_SAFE("Order {} {} {} {} qty {} -> {} (filled {}, {} trades)",
                  plan.taker.id, to_string(plan.taker.side), to_string(plan.taker.type),
                  plan.taker.ticker, plan.taker.quantity, to_string(plan.taker.status),
                  plan.taker.filled_quantity, plan.trades.size());
    return plan.taker;
}

MatchPlan MatchingEngine::plan_matches(const Order& taker) const {
    MatchPlan plan;
    plan.taker = taker;

    const std::string& quote = config_.quote_currency;
    auto projected = [&](const BalanceKey& key) {
        auto it = plan.deltas.find(key);
        Amount pending = it == plan.deltas.end() ? 0 : it->second;
        return ledger_.get_balance(key.user_id, key.ticker) + pending;
    };

    std::optional<Price> limit;
    if (taker.type == OrderType::LIMIT) {
        limit = taker.price;
    }

    auto candidates = orders_.match_candidates(taker.ticker, taker.side, limit);
    auto now = std::chrono::system_clock::now();

    for (const auto& maker : candidates) {
        if (plan.taker.remaining() <= 0) break;
        if (maker.remaining() <= 0) continue;

        Price price = *maker.price;
        bool taker_buys = taker.side == Side::BUY;
        const UserID& buyer = taker_buys ? taker.user_id : maker.user_id;
        const UserID& seller = taker_buys ? maker.user_id : taker.user_id;

        Quantity buyer_cap = projected(BalanceKey{buyer, quote}) / price;
        Quantity seller_cap = projected(BalanceKey{seller, taker.ticker});
        Quantity taker_cap = taker_buys ? buyer_cap : seller_cap;
        Quantity maker_cap = taker_buys ? seller_cap : buyer_cap;

        if (taker_cap <= 0) {
            LOG_DEBUG_SAFE("Order {} cannot fund further fills", taker.id);
            plan.taker_unfunded = true;
            break;
        }
        if (maker_cap <= 0) {
            // A maker its owner can no longer settle leaves the book
            Order dropped = maker;
            dropped.status = OrderStatus::CANCELLED;
            plan.maker_updates.emplace_back(maker, dropped);
            LOG_WARN_SAFE("Maker {} cancelled: user {} cannot settle it", maker.id, maker.user_id);
            continue;
        }

        Quantity quantity = std::min({plan.taker.remaining(), maker.remaining(), taker_cap, maker_cap});
        Amount notional = quantity * price;

        Order filled_maker = maker;
        filled_maker.filled_quantity += quantity;
        if (filled_maker.remaining() == 0) {
            filled_maker.status = OrderStatus::EXECUTED;
        } else if (quantity == maker_cap) {
            // Remainder beyond what the owner holds is unbacked
            filled_maker.status = OrderStatus::CANCELLED;
            LOG_WARN_SAFE("Maker {} cancelled with {} unbacked", maker.id, filled_maker.remaining());
        } else {
            filled_maker.status = OrderStatus::PARTIALLY_EXECUTED;
        }
        plan.maker_updates.emplace_back(maker, filled_maker);
        plan.taker.filled_quantity += quantity;
        if (quantity == taker_cap && plan.taker.remaining() > 0) {
            plan.taker_unfunded = true;
        }

        Trade trade;
        trade.ticker = taker.ticker;
        trade.price = price;
        trade.quantity = quantity;
        trade.buy_order_id = taker_buys ? taker.id : maker.id;
        trade.sell_order_id = taker_buys ? maker.id : taker.id;
        trade.executed_at = now;
        plan.trades.push_back(trade);

        plan.deltas[BalanceKey{buyer, taker.ticker}] += quantity;
        plan.deltas[BalanceKey{buyer, quote}] -= notional;
        plan.deltas[BalanceKey{seller, taker.ticker}] -= quantity;
        plan.deltas[BalanceKey{seller, quote}] += notional;

        LOG_DEBUG_SAFE("Fill {} {}@{} buy {} sell {}", taker.ticker, quantity, price,
                       trade.buy_order_id, trade.sell_order_id);
        if (plan.taker_unfunded) break;
    }

    plan.taker.status = taker_status(plan.taker, plan.taker_unfunded);
    return plan;
}

OrderStatus MatchingEngine::taker_status(const Order& taker, bool unfunded) {
    if (taker.filled_quantity == taker.quantity) {
        return OrderStatus::EXECUTED;
    }
    if (taker.type == OrderType::MARKET) {
        // Market orders never rest
        return taker.filled_quantity > 0 ? OrderStatus::EXECUTED : OrderStatus::CANCELLED;
    }
    if (unfunded) {
        // Resting the remainder would cross the book with no funds behind it
        return OrderStatus::CANCELLED;
    }
    return taker.filled_quantity > 0 ? OrderStatus::PARTIALLY_EXECUTED : OrderStatus::NEW;
}

Result<Order> MatchingEngine::cancel_order(const OrderID& order_id, const UserID& user_id) {
    auto lock = gate_.exclusive();

    auto order = orders_.find(order_id);
    if (!order) {
        return ErrorCode::ORDER_NOT_FOUND;
    }

    auto allowed = risk_.validate_cancel(*order, user_id);
    if (allowed.has_error()) {
        return allowed.error();
    }

    Order cancelled = *order;
    cancelled.status = OrderStatus::CANCELLED;

    Transaction tx("cancel_" + order_id.to_string());
    tx.add_action(std::make_unique<UpdateOrderAction>(orders_, *order, cancelled));
    auto committed = tx.commit();
    if (committed.has_error()) {
        rollbacks_.fetch_add(1);
        return committed.error();
    }

    LOG_INFO_SAFE("Order {} cancelled with {} unfilled", order_id, cancelled.remaining());
    return cancelled;
}

} // namespace bourse
