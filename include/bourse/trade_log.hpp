#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bourse {

// Append-only record of executed trades. Entries leave only through
// rollback of the submission that wrote them or through cascading deletion.
class TradeLog {
public:
    // Assigns the trade id and returns the stored record
    Trade append(Trade trade);
    Result<void> remove(TradeID trade_id);

    // Newest first
    std::vector<Trade> recent(const std::string& ticker, size_t limit) const;
    std::vector<Trade> for_order(const OrderID& order_id) const;

    // Volume-weighted execution price, or nullopt when the order never traded
    std::optional<double> average_price(const OrderID& order_id) const;

    size_t erase_ticker(const std::string& ticker);
    size_t erase_orders(const std::unordered_set<OrderID>& order_ids);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<TradeID, Trade> trades_ GUARDED_BY(mutex_);
    std::unordered_map<OrderID, std::vector<TradeID>> by_order_ GUARDED_BY(mutex_);
    TradeID next_id_ GUARDED_BY(mutex_) = 1;

    void unlink(const Trade& trade) REQUIRES(mutex_);
};

} // namespace bourse
