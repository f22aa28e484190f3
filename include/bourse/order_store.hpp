#pragma once

#include "bourse/error_handling.hpp"
#include "bourse/order_book.hpp"
#include "bourse/thread_safety.hpp"
#include "bourse/types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bourse {

// Order repository. Owns every order row and keeps the book index in step
// with each insert, update and erase.
class OrderStore {
public:
    Result<void> insert(const Order& order);
    Result<void> update(const Order& order);
    Result<void> erase(const OrderID& order_id);

    std::optional<Order> find(const OrderID& order_id) const;

    // Newest first
    std::vector<Order> orders_of(const UserID& user_id) const;

    // Copies of the resting counter-orders in matching priority
    std::vector<Order> match_candidates(const std::string& ticker, Side taker_side,
                                        std::optional<Price> limit) const;

    BookSnapshot book(const std::string& ticker, size_t depth) const;

    // Both return the removed order ids
    std::vector<OrderID> erase_ticker(const std::string& ticker);
    std::vector<OrderID> erase_user(const UserID& user_id);

    SequenceNumber next_sequence() { return sequence_.fetch_add(1) + 1; }

    size_t size() const;
    size_t resting_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<OrderID, Order> orders_ GUARDED_BY(mutex_);
    OrderBookIndex index_ GUARDED_BY(mutex_);
    atomic_wrapper<SequenceNumber> sequence_{0};
};

} // namespace bourse
