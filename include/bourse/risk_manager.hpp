#pragma once

#include "bourse/config.hpp"
#include "bourse/error_handling.hpp"
#include "bourse/instrument_registry.hpp"
#include "bourse/ledger_store.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include "bourse/user_registry.hpp"

namespace bourse {

// Pre-trade checks run before an order is created. Nothing here mutates
// state, so a rejected order leaves no trace.
class RiskManager {
public:
    RiskManager(const EngineConfig& config, const InstrumentRegistry& instruments,
                const UserRegistry& users, const Ledger& ledger);

    // Returns the request with ticker upper-cased and any MARKET price dropped
    Result<OrderRequest> validate_new_order(const OrderRequest& request) const;

    // Balance sufficiency against the current ledger
    Result<void> check_affordability(const OrderRequest& request) const;

    // Quote currency (BUY) or asset (SELL) amount the order must be covered by
    Result<Amount> required_balance(const OrderRequest& request) const;

    // Repeats the registry checks once the settlement gate is held; a user or
    // instrument deleted after validate_new_order fails the submission here
    Result<void> confirm_parties(const Order& order) const;

    Result<void> validate_cancel(const Order& order, const UserID& user_id) const;

    uint64_t orders_checked() const { return orders_checked_.load(); }
    uint64_t orders_rejected() const { return orders_rejected_.load(); }

private:
    EngineConfig config_;
    const InstrumentRegistry& instruments_;
    const UserRegistry& users_;
    const Ledger& ledger_;

    mutable atomic_wrapper<uint64_t> orders_checked_{0};
    mutable atomic_wrapper<uint64_t> orders_rejected_{0};

    ErrorCode reject(const OrderRequest& request, ErrorCode code) const;
};

} // namespace bourse
