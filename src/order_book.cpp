/**
 * @file order_book.cpp
 * @brief Price/time priority index over resting limit orders
 *
 * Each ticker keeps two price-level maps: bids in descending price order and
 * asks in ascending order. Inside a level, orders are keyed by their
 * submission sequence so the earliest order is always first.
 *
 * Matching walks `candidates()`; the depth query aggregates remaining
 * quantity per level. An order leaves the index as soon as it stops resting
 * (filled, cancelled or market).
 */

#include "bourse/order_book.hpp"
#include "bourse/logger.hpp"
#include <algorithm>

namespace bourse {

template<typename Levels>
void OrderBookIndex::remove_from(Levels& levels, const Location& location) {
    auto level_it = levels.find(location.price);
    if (level_it == levels.end()) {
        return;
    }

    auto& level = level_it->second;
    auto order_it = level.orders.find(location.sequence);
    if (order_it != level.orders.end()) {
        level.total_quantity -= order_it->second.remaining;
        level.orders.erase(order_it);
    }

    if (level.orders.empty()) {
        levels.erase(level_it);
    }
}

void OrderBookIndex::unindex(const OrderID& order_id) {
    auto it = locations_.find(order_id);
    if (it == locations_.end()) {
        return;
    }

    auto book_it = books_.find(it->second.ticker);
    if (book_it != books_.end()) {
        if (it->second.side == Side::BUY) {
            remove_from(book_it->second.bids, it->second);
        } else {
            remove_from(book_it->second.asks, it->second);
        }
    }
    locations_.erase(it);
}

void OrderBookIndex::index(const Order& order) {
    unindex(order.id);
    if (!order.is_resting()) {
        return;
    }

    auto& book = books_[order.ticker];
    Price price = *order.price;
    RestingEntry entry{order.id, order.remaining()};

    auto place = [&](auto& levels) {
        auto level_it = levels.try_emplace(price, price).first;
        level_it->second.orders.emplace(order.sequence, entry);
        level_it->second.total_quantity += entry.remaining;
    };

    if (order.side == Side::BUY) {
        place(book.bids);
    } else {
        place(book.asks);
    }

    locations_.emplace(order.id, Location{order.ticker, order.side, price, order.sequence});
}

template<typename Levels>
void OrderBookIndex::collect(const Levels& levels, std::optional<Price> limit,
                             const std::function<bool(Price, Price)>& beyond,
                             std::vector<OrderID>& out) {
    for (const auto& [price, level] : levels) {
        if (limit && beyond(price, *limit)) {
            break;
        }
        for (const auto& [sequence, entry] : level.orders) {
            out.push_back(entry.id);
        }
    }
}

std::vector<OrderID> OrderBookIndex::candidates(const std::string& ticker, Side taker_side,
                                                std::optional<Price> limit) const {
    std::vector<OrderID> result;
    auto book_it = books_.find(ticker);
    if (book_it == books_.end()) {
        return result;
    }

    if (taker_side == Side::BUY) {
        // Buyer takes asks priced at or below its limit
        collect(book_it->second.asks, limit, [](Price ask, Price lim) { return ask > lim; }, result);
    } else {
        // Seller takes bids priced at or above its limit
        collect(book_it->second.bids, limit, [](Price bid, Price lim) { return bid < lim; }, result);
    }
    return result;
}

template<typename Levels>
std::vector<BookLevel> OrderBookIndex::aggregate(const Levels& levels, size_t depth) {
    std::vector<BookLevel> result;
    result.reserve(std::min(depth, levels.size()));
    for (const auto& [price, level] : levels) {
        if (result.size() >= depth) break;
        result.push_back(BookLevel{price, level.total_quantity});
    }
    return result;
}

BookSnapshot OrderBookIndex::snapshot(const std::string& ticker, size_t depth) const {
    BookSnapshot snapshot;
    auto book_it = books_.find(ticker);
    if (book_it == books_.end()) {
        return snapshot;
    }
    snapshot.bids = aggregate(book_it->second.bids, depth);
    snapshot.asks = aggregate(book_it->second.asks, depth);
    return snapshot;
}

size_t OrderBookIndex::erase_ticker(const std::string& ticker) {
    size_t removed = std::erase_if(locations_, [&](const auto& entry) {
        return entry.second.ticker == ticker;
    });
    books_.erase(ticker);
    if (removed > 0) {
        LOG_DEBUG_SAFE("Dropped {} resting orders from book {}", removed, ticker);
    }
    return removed;
}

} // namespace bourse
