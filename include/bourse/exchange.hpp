#pragma once

#include "bourse/config.hpp"
#include "bourse/error_handling.hpp"
#include "bourse/instrument_registry.hpp"
#include "bourse/ledger_store.hpp"
#include "bourse/matching_engine.hpp"
#include "bourse/order_store.hpp"
#include "bourse/risk_manager.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/trade_log.hpp"
#include "bourse/types.hpp"
#include "bourse/user_registry.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bourse {

// Entry point for callers. Owns every store and wires them to the engine.
class Exchange {
public:
    // A null store selects the in-memory ledger
    explicit Exchange(std::unique_ptr<Config> config, std::unique_ptr<LedgerStore> store = nullptr);
    ~Exchange();

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // Users
    Result<User> register_user(std::string_view name);
    Result<void> delete_user(const UserID& user_id);
    std::optional<User> find_user(const UserID& user_id) const { return users_.find(user_id); }
    std::optional<User> find_user_by_name(std::string_view name) const { return users_.find_by_name(name); }

    // Instruments
    Result<Instrument> add_instrument(std::string_view ticker, std::string_view kind);
    Result<void> delete_instrument(std::string_view ticker);
    std::vector<Instrument> list_instruments() const { return instruments_.list(); }

    // Trading
    Result<Order> submit_order(const OrderRequest& request);
    Result<Order> cancel_order(const OrderID& order_id, const UserID& user_id);
    Result<OrderReport> get_order(const OrderID& order_id, const UserID& user_id) const;
    Result<std::vector<OrderReport>> list_orders(const UserID& user_id) const;

    // Market data; an absent depth or limit takes the configured default
    Result<BookSnapshot> get_book(std::string_view ticker, std::optional<size_t> depth = std::nullopt) const;
    Result<std::vector<Trade>> get_recent_trades(std::string_view ticker,
                                                 std::optional<size_t> limit = std::nullopt) const;

    // Balances; returns the new amount
    Result<Amount> adjust_balance(const UserID& user_id, std::string_view ticker, Amount delta);
    Result<std::map<std::string, Amount>> get_balances(const UserID& user_id) const;

    // Component access for testing
    const Config& config() const { return *config_; }
    MatchingEngine& matching_engine() { return *matching_engine_; }
    RiskManager& risk_manager() { return *risk_manager_; }
    Ledger& ledger() { return *ledger_; }
    const OrderStore& order_store() const { return orders_; }
    const TradeLog& trade_log() const { return trades_; }

private:
    std::unique_ptr<Config> config_;
    mutable SettlementGate gate_;

    std::unique_ptr<LedgerStore> store_;
    std::unique_ptr<Ledger> ledger_;
    OrderStore orders_;
    TradeLog trades_;
    InstrumentRegistry instruments_;
    UserRegistry users_;

    std::unique_ptr<RiskManager> risk_manager_;
    std::unique_ptr<MatchingEngine> matching_engine_;

    void initialize_logging();
    void initialize_ledger();
    void initialize_instruments();
    void initialize_engine();

    Result<std::string> resolve_ticker(std::string_view ticker) const;
    OrderReport make_report(const Order& order) const;
};

} // namespace bourse
