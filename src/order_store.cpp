#include "bourse/order_store.hpp"
#include "bourse/logger.hpp"
#include <algorithm>
#include <mutex>

namespace bourse {

Result<void> OrderStore::insert(const Order& order) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = orders_.emplace(order.id, order);
    if (!inserted) {
        LOG_ERROR_SAFE("Duplicate order id {}", order.id);
        return ErrorCode::ORDER_DUPLICATE;
    }
    index_.index(order);
    return Result<void>();
}

Result<void> OrderStore::update(const Order& order) {
    std::unique_lock lock(mutex_);
    auto it = orders_.find(order.id);
    if (it == orders_.end()) {
        return ErrorCode::ORDER_NOT_FOUND;
    }
    it->second = order;
    index_.index(order);
    return Result<void>();
}

Result<void> OrderStore::erase(const OrderID& order_id) {
    std::unique_lock lock(mutex_);
    if (orders_.erase(order_id) == 0) {
        return ErrorCode::ORDER_NOT_FOUND;
    }
    index_.unindex(order_id);
    return Result<void>();
}

std::optional<Order> OrderStore::find(const OrderID& order_id) const {
    std::shared_lock lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Order> OrderStore::orders_of(const UserID& user_id) const {
    std::vector<Order> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, order] : orders_) {
            if (order.user_id == user_id) {
                result.push_back(order);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const Order& a, const Order& b) {
        return a.sequence > b.sequence;
    });
    return result;
}

std::vector<Order> OrderStore::match_candidates(const std::string& ticker, Side taker_side,
                                                std::optional<Price> limit) const {
    std::shared_lock lock(mutex_);
    std::vector<Order> result;
    for (const auto& id : index_.candidates(ticker, taker_side, limit)) {
        auto it = orders_.find(id);
        if (it != orders_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

BookSnapshot OrderStore::book(const std::string& ticker, size_t depth) const {
    std::shared_lock lock(mutex_);
    return index_.snapshot(ticker, depth);
}

std::vector<OrderID> OrderStore::erase_ticker(const std::string& ticker) {
    std::unique_lock lock(mutex_);
    std::vector<OrderID> removed;
    for (auto it = orders_.begin(); it != orders_.end();) {
        if (it->second.ticker == ticker) {
            removed.push_back(it->first);
            it = orders_.erase(it);
        } else {
            ++it;
        }
    }
    index_.erase_ticker(ticker);
    return removed;
}

std::vector<OrderID> OrderStore::erase_user(const UserID& user_id) {
    std::unique_lock lock(mutex_);
    std::vector<OrderID> removed;
    for (auto it = orders_.begin(); it != orders_.end();) {
        if (it->second.user_id == user_id) {
            removed.push_back(it->first);
            index_.unindex(it->first);
            it = orders_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

size_t OrderStore::size() const {
    std::shared_lock lock(mutex_);
    return orders_.size();
}

size_t OrderStore::resting_count() const {
    std::shared_lock lock(mutex_);
    return index_.resting_count();
}

} // namespace bourse
