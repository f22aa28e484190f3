#include "bourse/types.hpp"

namespace bourse {

std::string_view to_string(Side side) {
    switch (side) {
        case Side::BUY: return "BUY";
        case Side::SELL: return "SELL";
    }
    return "UNKNOWN";
}

std::string_view to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
    }
    return "UNKNOWN";
}

std::string_view to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW: return "NEW";
        case OrderStatus::PARTIALLY_EXECUTED: return "PARTIALLY_EXECUTED";
        case OrderStatus::EXECUTED: return "EXECUTED";
        case OrderStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<Side> parse_side(std::string_view text) {
    if (text == "BUY") return Side::BUY;
    if (text == "SELL") return Side::SELL;
    return std::nullopt;
}

} // namespace bourse
