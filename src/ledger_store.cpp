#include "bourse/ledger_store.hpp"
#include "bourse/logger.hpp"
#include <mutex>

namespace bourse {

// InMemoryLedgerStore implementation
Result<Amount> InMemoryLedgerStore::upsert_increment(const BalanceKey& key, Amount delta) {
    std::unique_lock lock(mutex_);

    auto it = rows_.find(key);
    Amount current = it == rows_.end() ? 0 : it->second.amount;

    Amount updated = 0;
    if (__builtin_add_overflow(current, delta, &updated)) {
        return ErrorCode::NOTIONAL_OVERFLOW;
    }
    if (updated < 0) {
        return ErrorCode::INSUFFICIENT_FUNDS;
    }

    auto now = std::chrono::system_clock::now();
    if (it == rows_.end()) {
        rows_.emplace(key, BalanceRecord{updated, now});
    } else {
        it->second.amount = updated;
        it->second.updated_at = now;
    }
    return updated;
}

std::optional<BalanceRecord> InMemoryLedgerStore::find(const BalanceKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> InMemoryLedgerStore::restore(const BalanceKey& key, const std::optional<BalanceRecord>& record) {
    std::unique_lock lock(mutex_);
    if (record) {
        rows_[key] = *record;
    } else {
        rows_.erase(key);
    }
    return Result<void>();
}

std::map<std::string, Amount> InMemoryLedgerStore::balances_of(const UserID& user_id) const {
    std::shared_lock lock(mutex_);
    std::map<std::string, Amount> result;
    for (auto it = rows_.lower_bound(BalanceKey{user_id, ""});
         it != rows_.end() && it->first.user_id == user_id; ++it) {
        result.emplace(it->first.ticker, it->second.amount);
    }
    return result;
}

size_t InMemoryLedgerStore::erase_ticker(const std::string& ticker) {
    std::unique_lock lock(mutex_);
    return std::erase_if(rows_, [&](const auto& row) { return row.first.ticker == ticker; });
}

size_t InMemoryLedgerStore::erase_user(const UserID& user_id) {
    std::unique_lock lock(mutex_);
    return std::erase_if(rows_, [&](const auto& row) { return row.first.user_id == user_id; });
}

size_t InMemoryLedgerStore::row_count() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

// Ledger implementation
Ledger::Ledger(LedgerStore& store, SettlementGate& gate, RetryPolicy retry_policy)
    : store_(store), gate_(gate), retry_policy_(std::move(retry_policy)) {}

Amount Ledger::get_balance(const UserID& user_id, const std::string& ticker) const {
    return store_.balance(BalanceKey{user_id, ticker});
}

bool Ledger::has_at_least(const UserID& user_id, const std::string& ticker, Amount amount) const {
    return get_balance(user_id, ticker) >= amount;
}

Result<Amount> Ledger::apply_delta(const BalanceKey& key, Amount delta) {
    if (!gate_.held_by_current_thread()) {
        LOG_ERROR_SAFE("Balance change for {}/{} attempted outside the settlement gate",
                       key.user_id, key.ticker);
        return ErrorCode::GATE_NOT_HELD;
    }

    ErrorContext context("Ledger", "apply_delta", key.user_id.to_string() + "/" + key.ticker);
    auto result = retry_policy_.run(context, [&]() { return store_.upsert_increment(key, delta); });
    if (result.has_value()) {
        LOG_DEBUG_SAFE("Balance {}/{} changed by {} to {}", key.user_id, key.ticker, delta, result.value());
    }
    return result;
}

Result<void> Ledger::restore(const BalanceKey& key, const std::optional<BalanceRecord>& record) {
    if (!gate_.held_by_current_thread()) {
        return ErrorCode::GATE_NOT_HELD;
    }
    return store_.restore(key, record);
}

size_t Ledger::erase_ticker(const std::string& ticker) {
    return store_.erase_ticker(ticker);
}

size_t Ledger::erase_user(const UserID& user_id) {
    return store_.erase_user(user_id);
}

} // namespace bourse
