#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include <compare>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bourse {

struct BalanceKey {
    UserID user_id;
    std::string ticker;

    auto operator<=>(const BalanceKey&) const = default;
};

struct BalanceRecord {
    Amount amount{0};
    Timestamp updated_at;
};

// Storage contract for balance rows. Rows are created lazily by the first
// increment and an absent row reads as zero.
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    // Atomically adds `delta` to the row, creating it at zero when absent.
    // Refuses with INSUFFICIENT_FUNDS when the result would be negative.
    // May fail with STORE_TRANSIENT_CONFLICT, in which case nothing changed.
    virtual Result<Amount> upsert_increment(const BalanceKey& key, Amount delta) = 0;

    virtual std::optional<BalanceRecord> find(const BalanceKey& key) const = 0;

    // Puts a row back to a previously observed state; nullopt removes it
    virtual Result<void> restore(const BalanceKey& key, const std::optional<BalanceRecord>& record) = 0;

    virtual std::map<std::string, Amount> balances_of(const UserID& user_id) const = 0;

    virtual size_t erase_ticker(const std::string& ticker) = 0;
    virtual size_t erase_user(const UserID& user_id) = 0;

    Amount balance(const BalanceKey& key) const {
        auto record = find(key);
        return record ? record->amount : 0;
    }
};

class InMemoryLedgerStore : public LedgerStore {
public:
    Result<Amount> upsert_increment(const BalanceKey& key, Amount delta) override;
    std::optional<BalanceRecord> find(const BalanceKey& key) const override;
    Result<void> restore(const BalanceKey& key, const std::optional<BalanceRecord>& record) override;
    std::map<std::string, Amount> balances_of(const UserID& user_id) const override;
    size_t erase_ticker(const std::string& ticker) override;
    size_t erase_user(const UserID& user_id) override;

    size_t row_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<BalanceKey, BalanceRecord> rows_ GUARDED_BY(mutex_);
};

// Balance ledger. Mutations are only accepted from the thread holding the
// settlement gate and every increment goes through the retry policy.
class Ledger {
public:
    Ledger(LedgerStore& store, SettlementGate& gate, RetryPolicy retry_policy);

    Amount get_balance(const UserID& user_id, const std::string& ticker) const;
    bool has_at_least(const UserID& user_id, const std::string& ticker, Amount amount) const;

    Result<Amount> apply_delta(const BalanceKey& key, Amount delta);

    // Rollback hook; bypasses retry since it restores an observed state
    Result<void> restore(const BalanceKey& key, const std::optional<BalanceRecord>& record);

    std::optional<BalanceRecord> find(const BalanceKey& key) const { return store_.find(key); }
    std::map<std::string, Amount> balances(const UserID& user_id) const { return store_.balances_of(user_id); }

    size_t erase_ticker(const std::string& ticker);
    size_t erase_user(const UserID& user_id);

    RetryPolicy& retry_policy() { return retry_policy_; }

private:
    LedgerStore& store_;
    SettlementGate& gate_;
    RetryPolicy retry_policy_;
};

} // namespace bourse
