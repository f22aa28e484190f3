#include "bourse/trade_log.hpp"
#include "bourse/logger.hpp"
#include <algorithm>
#include <mutex>

namespace bourse {

Trade TradeLog::append(Trade trade) {
    std::unique_lock lock(mutex_);
    trade.id = next_id_++;
    by_order_[trade.buy_order_id].push_back(trade.id);
    if (trade.sell_order_id != trade.buy_order_id) {
        by_order_[trade.sell_order_id].push_back(trade.id);
    }
    trades_.emplace(trade.id, trade);
    return trade;
}

void TradeLog::unlink(const Trade& trade) {
    for (const auto& order_id : {trade.buy_order_id, trade.sell_order_id}) {
        auto it = by_order_.find(order_id);
        if (it == by_order_.end()) continue;
        std::erase(it->second, trade.id);
        if (it->second.empty()) {
            by_order_.erase(it);
        }
    }
}

Result<void> TradeLog::remove(TradeID trade_id) {
    std::unique_lock lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }
    unlink(it->second);
    trades_.erase(it);
    return Result<void>();
}

std::vector<Trade> TradeLog::recent(const std::string& ticker, size_t limit) const {
    std::shared_lock lock(mutex_);
    std::vector<Trade> result;
    for (auto it = trades_.rbegin(); it != trades_.rend() && result.size() < limit; ++it) {
        if (it->second.ticker == ticker) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<Trade> TradeLog::for_order(const OrderID& order_id) const {
    std::shared_lock lock(mutex_);
    std::vector<Trade> result;
    auto it = by_order_.find(order_id);
    if (it == by_order_.end()) {
        return result;
    }
    for (TradeID id : it->second) {
        auto trade_it = trades_.find(id);
        if (trade_it != trades_.end()) {
            result.push_back(trade_it->second);
        }
    }
    return result;
}

std::optional<double> TradeLog::average_price(const OrderID& order_id) const {
    auto trades = for_order(order_id);
    Quantity volume = 0;
    long double notional = 0;
    for (const auto& trade : trades) {
        volume += trade.quantity;
        notional += static_cast<long double>(trade.price) * trade.quantity;
    }
    if (volume == 0) {
        return std::nullopt;
    }
    return static_cast<double>(notional / volume);
}

size_t TradeLog::erase_ticker(const std::string& ticker) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = trades_.begin(); it != trades_.end();) {
        if (it->second.ticker == ticker) {
            unlink(it->second);
            it = trades_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TradeLog::erase_orders(const std::unordered_set<OrderID>& order_ids) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = trades_.begin(); it != trades_.end();) {
        if (order_ids.count(it->second.buy_order_id) || order_ids.count(it->second.sell_order_id)) {
            unlink(it->second);
            it = trades_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG_SAFE("Removed {} trades referencing deleted orders", removed);
    }
    return removed;
}

size_t TradeLog::size() const {
    std::shared_lock lock(mutex_);
    return trades_.size();
}

} // namespace bourse
