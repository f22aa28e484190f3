#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/ledger_store.hpp"
#include "bourse/order_store.hpp"
#include "bourse/trade_log.hpp"
#include "bourse/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bourse {

// Transaction action interface
class TransactionAction {
public:
    virtual ~TransactionAction() = default;
    virtual Result<void> execute() = 0;
    virtual Result<void> rollback() = 0;
    virtual std::string description() const = 0;
};

// RAII transaction. Anything executed and not committed is undone in
// reverse order when the transaction goes out of scope.
class Transaction {
public:
    explicit Transaction(std::string name = "");
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Executes now and journals the action for rollback
    Result<void> apply(std::unique_ptr<TransactionAction> action);

    // Deferred until commit()
    void add_action(std::unique_ptr<TransactionAction> action);

    Result<void> commit();
    Result<void> rollback();

    bool is_active() const { return state_ == State::ACTIVE; }
    bool is_committed() const { return state_ == State::COMMITTED; }
    bool is_rolled_back() const { return state_ == State::ROLLED_BACK; }

    size_t pending_actions() const { return actions_.size(); }
    const std::string& name() const { return name_; }

private:
    enum class State { ACTIVE, COMMITTED, ROLLED_BACK };

    std::string name_;
    std::vector<std::unique_ptr<TransactionAction>> actions_;
    std::vector<std::unique_ptr<TransactionAction>> executed_actions_;
    State state_ = State::ACTIVE;
};

// Concrete transaction actions
class InsertOrderAction : public TransactionAction {
public:
    InsertOrderAction(OrderStore& store, Order order);

    Result<void> execute() override;
    Result<void> rollback() override;
    std::string description() const override;

private:
    OrderStore& store_;
    Order order_;
};

class UpdateOrderAction : public TransactionAction {
public:
    UpdateOrderAction(OrderStore& store, Order before, Order after);

    Result<void> execute() override;
    Result<void> rollback() override;
    std::string description() const override;

private:
    OrderStore& store_;
    Order before_;
    Order after_;
};

class AppendTradeAction : public TransactionAction {
public:
    AppendTradeAction(TradeLog& log, Trade trade);

    Result<void> execute() override;
    Result<void> rollback() override;
    std::string description() const override;

    const Trade& trade() const { return trade_; }

private:
    TradeLog& log_;
    Trade trade_;
    bool appended_ = false;
};

class BalanceDeltaAction : public TransactionAction {
public:
    BalanceDeltaAction(Ledger& ledger, BalanceKey key, Amount delta);

    Result<void> execute() override;
    Result<void> rollback() override;
    std::string description() const override;

private:
    Ledger& ledger_;
    BalanceKey key_;
    Amount delta_;
    std::optional<BalanceRecord> saved_;
};

} // namespace bourse
