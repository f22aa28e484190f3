#include "bourse/transaction.hpp"
#include "bourse/logger.hpp"
#include <cstdint>

namespace bourse {

// Transaction implementation
Transaction::Transaction(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        name_ = "Transaction_" + std::to_string(reinterpret_cast<uintptr_t>(this));
    }
    LOG_DEBUG_SAFE("Transaction {} started", name_);
}

Transaction::~Transaction() {
    if (state_ == State::ACTIVE && !executed_actions_.empty()) {
        LOG_WARN_SAFE("Auto-rolling back transaction {}", name_);
        auto result = rollback();
        if (result.has_error()) {
            LOG_FATAL_SAFE("Auto-rollback of {} incomplete: {}", name_, result.error().message());
        }
    }
}

Result<void> Transaction::apply(std::unique_ptr<TransactionAction> action) {
    if (state_ != State::ACTIVE) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    auto result = action->execute();
    if (result.has_error()) {
        LOG_WARN_SAFE("Action '{}' failed in transaction {}: {}",
                      action->description(), name_, result.error().message());
        return result;
    }
    executed_actions_.push_back(std::move(action));
    return Result<void>();
}

void Transaction::add_action(std::unique_ptr<TransactionAction> action) {
    if (state_ != State::ACTIVE) {
        LOG_ERROR_SAFE("Cannot add action to inactive transaction {}", name_);
        return;
    }

    LOG_DEBUG_SAFE("Added action '{}' to transaction {}", action->description(), name_);
    actions_.push_back(std::move(action));
}

Result<void> Transaction::commit() {
    if (state_ != State::ACTIVE) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    LOG_DEBUG_SAFE("Committing transaction {} with {} actions", name_, actions_.size());

    for (auto& action : actions_) {
        auto result = action->execute();
        if (result.has_error()) {
            LOG_ERROR_SAFE("Action '{}' failed in transaction {}: {}",
                           action->description(), name_, result.error().message());

            auto rollback_result = rollback();
            if (rollback_result.has_error()) {
                return rollback_result.error();
            }
            return result.error();
        }

        executed_actions_.push_back(std::move(action));
    }

    actions_.clear();
    state_ = State::COMMITTED;

    LOG_DEBUG_SAFE("Transaction {} committed", name_);
    return Result<void>();
}

Result<void> Transaction::rollback() {
    if (state_ == State::ROLLED_BACK) {
        return Result<void>();
    }
    if (state_ == State::COMMITTED) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    LOG_WARN_SAFE("Rolling back transaction {} with {} executed actions",
                  name_, executed_actions_.size());

    // Rollback in reverse order
    std::error_code last_error;
    for (auto it = executed_actions_.rbegin(); it != executed_actions_.rend(); ++it) {
        auto result = (*it)->rollback();
        if (result.has_error()) {
            LOG_ERROR_SAFE("Rollback failed for action '{}': {}",
                           (*it)->description(), result.error().message());
            last_error = result.error();
        }
    }

    executed_actions_.clear();
    actions_.clear();
    state_ = State::ROLLED_BACK;

    if (last_error) {
        return last_error;
    }
    return Result<void>();
}

// InsertOrderAction implementation
InsertOrderAction::InsertOrderAction(OrderStore& store, Order order)
    : store_(store), order_(std::move(order)) {}

Result<void> InsertOrderAction::execute() {
    return store_.insert(order_);
}

Result<void> InsertOrderAction::rollback() {
    return store_.erase(order_.id);
}

std::string InsertOrderAction::description() const {
    return "insert order " + order_.id.to_string();
}

// UpdateOrderAction implementation
UpdateOrderAction::UpdateOrderAction(OrderStore& store, Order before, Order after)
    : store_(store), before_(std::move(before)), after_(std::move(after)) {}

Result<void> UpdateOrderAction::execute() {
    return store_.update(after_);
}

Result<void> UpdateOrderAction::rollback() {
    return store_.update(before_);
}

std::string UpdateOrderAction::description() const {
    return "update order " + after_.id.to_string() + " to " + std::string(to_string(after_.status));
}

// AppendTradeAction implementation
AppendTradeAction::AppendTradeAction(TradeLog& log, Trade trade)
    : log_(log), trade_(std::move(trade)) {}

Result<void> AppendTradeAction::execute() {
    trade_ = log_.append(trade_);
    appended_ = true;
    return Result<void>();
}

Result<void> AppendTradeAction::rollback() {
    if (!appended_) {
        return Result<void>();
    }
    appended_ = false;
    return log_.remove(trade_.id);
}

std::string AppendTradeAction::description() const {
    return SecurityUtils::safe_format("trade {} {}@{}", trade_.ticker, trade_.quantity, trade_.price);
}

// BalanceDeltaAction implementation
BalanceDeltaAction::BalanceDeltaAction(Ledger& ledger, BalanceKey key, Amount delta)
    : ledger_(ledger), key_(std::move(key)), delta_(delta) {}

Result<void> BalanceDeltaAction::execute() {
    saved_ = ledger_.find(key_);
    auto result = ledger_.apply_delta(key_, delta_);
    if (result.has_error()) {
        return result.error();
    }
    return Result<void>();
}

Result<void> BalanceDeltaAction::rollback() {
    return ledger_.restore(key_, saved_);
}

std::string BalanceDeltaAction::description() const {
    return SecurityUtils::safe_format("balance {}/{} {}", key_.user_id, key_.ticker, delta_);
}

} // namespace bourse
