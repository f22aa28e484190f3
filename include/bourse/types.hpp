#pragma once

#include "bourse/uuid.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bourse {

using OrderID = Uuid;
using UserID = Uuid;
using Price = int64_t;     // Quote currency units per asset unit
using Quantity = int64_t;
using Amount = int64_t;
using TradeID = uint64_t;
using SequenceNumber = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class Side : uint8_t {
    BUY = 1,
    SELL = 2
};

enum class OrderType : uint8_t {
    MARKET = 1,
    LIMIT = 2
};

enum class OrderStatus : uint8_t {
    NEW = 0,
    PARTIALLY_EXECUTED = 1,
    EXECUTED = 2,
    CANCELLED = 3
};

std::string_view to_string(Side side);
std::string_view to_string(OrderType type);
std::string_view to_string(OrderStatus status);

std::optional<Side> parse_side(std::string_view text);

struct Instrument {
    std::string ticker;
    std::string kind;
    Timestamp created_at;
};

struct User {
    UserID id;
    std::string name;
    Timestamp created_at;
};

struct Order {
    OrderID id;
    UserID user_id;
    std::string ticker;
    Side side{Side::BUY};
    OrderType type{OrderType::LIMIT};
    std::optional<Price> price;      // Absent for MARKET orders
    Quantity quantity{0};
    Quantity filled_quantity{0};
    OrderStatus status{OrderStatus::NEW};
    Timestamp created_at;
    SequenceNumber sequence{0};      // Time-priority tiebreak, strictly increasing

    Quantity remaining() const { return quantity - filled_quantity; }

    bool is_terminal() const {
        return status == OrderStatus::EXECUTED || status == OrderStatus::CANCELLED;
    }

    // Eligible to be matched as a maker
    bool is_resting() const {
        return type == OrderType::LIMIT && price.has_value() && remaining() > 0 &&
               (status == OrderStatus::NEW || status == OrderStatus::PARTIALLY_EXECUTED);
    }
};

struct Trade {
    TradeID id{0};
    std::string ticker;
    Price price{0};
    Quantity quantity{0};
    OrderID buy_order_id;
    OrderID sell_order_id;
    Timestamp executed_at;
};

struct BookLevel {
    Price price{0};
    Quantity quantity{0};

    bool operator==(const BookLevel&) const = default;
};

struct BookSnapshot {
    std::vector<BookLevel> bids;  // Descending by price
    std::vector<BookLevel> asks;  // Ascending by price
};

// Order as requested by a caller, before validation
struct OrderRequest {
    UserID user_id;
    std::string ticker;
    Side side{Side::BUY};
    OrderType type{OrderType::LIMIT};
    Quantity quantity{0};
    std::optional<Price> price;
};

struct OrderReport {
    Order order;
    Quantity remaining_quantity{0};
    std::optional<double> average_execution_price;
};

} // namespace bourse
