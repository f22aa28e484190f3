#pragma once

#include "bourse/config.hpp"
#include "bourse/error_handling.hpp"
#include "bourse/ledger_store.hpp"
#include "bourse/order_store.hpp"
#include "bourse/risk_manager.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/trade_log.hpp"
#include "bourse/types.hpp"
#include <map>
#include <utility>
#include <vector>

namespace bourse {

// Everything one submission will write, computed before any of it is applied
struct MatchPlan {
    Order taker;
    std::vector<std::pair<Order, Order>> maker_updates;  // before, after
    std::vector<Trade> trades;
    std::map<BalanceKey, Amount> deltas;                 // Sorted by (user, ticker)
    bool taker_unfunded = false;                         // Stopped for lack of funds
};

class MatchingEngine {
public:
    MatchingEngine(const EngineConfig& config, SettlementGate& gate, Ledger& ledger,
                   OrderStore& orders, TradeLog& trades, RiskManager& risk);

    // Validates, persists and matches one order. Either every resulting
    // write is applied or the call fails and nothing is.
    Result<Order> submit_order(const OrderRequest& request);

    Result<Order> cancel_order(const OrderID& order_id, const UserID& user_id);

    // Statistics
    uint64_t orders_accepted() const { return orders_accepted_.load(); }
    uint64_t orders_rejected() const { return orders_rejected_.load(); }
    uint64_t trades_executed() const { return trades_executed_.load(); }
    uint64_t rollbacks() const { return rollbacks_.load(); }

private:
    EngineConfig config_;
    SettlementGate& gate_;
    Ledger& ledger_;
    OrderStore& orders_;
    TradeLog& trades_;
    RiskManager& risk_;

    atomic_wrapper<uint64_t> orders_accepted_{0};
    atomic_wrapper<uint64_t> orders_rejected_{0};
    atomic_wrapper<uint64_t> trades_executed_{0};
    atomic_wrapper<uint64_t> rollbacks_{0};

    Result<Order> build_order(const OrderRequest& request);

    // Walks the book for `taker` against a projected ledger. Requires the gate.
    MatchPlan plan_matches(const Order& taker) const;

    static OrderStatus taker_status(const Order& taker, bool unfunded);
};

} // namespace bourse
