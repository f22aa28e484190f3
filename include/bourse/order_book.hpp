#pragma once

#include "bourse/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bourse {

// Resting order as seen by the book
struct RestingEntry {
    OrderID id;
    Quantity remaining{0};
};

struct PriceLevel {
    Price price;
    std::map<SequenceNumber, RestingEntry> orders;  // Time priority within the level
    Quantity total_quantity{0};

    explicit PriceLevel(Price p) : price(p) {}
};

// Price/time ordered index over resting LIMIT orders, one book per ticker.
// Not synchronized; the owning OrderStore serializes access.
class OrderBookIndex {
public:
    // Adds, updates or removes the order depending on whether it is still resting
    void index(const Order& order);
    void unindex(const OrderID& order_id);

    // Counter-orders a taker on `taker_side` may match, best price first, earliest first.
    // A limit price restricts candidates to compatible makers.
    std::vector<OrderID> candidates(const std::string& ticker, Side taker_side,
                                    std::optional<Price> limit) const;

    BookSnapshot snapshot(const std::string& ticker, size_t depth) const;

    size_t erase_ticker(const std::string& ticker);
    bool contains(const OrderID& order_id) const { return locations_.count(order_id) > 0; }
    size_t resting_count() const { return locations_.size(); }

private:
    struct SymbolBook {
        std::map<Price, PriceLevel, std::greater<Price>> bids;  // Descending
        std::map<Price, PriceLevel> asks;                       // Ascending
    };

    struct Location {
        std::string ticker;
        Side side;
        Price price;
        SequenceNumber sequence;
    };

    std::unordered_map<std::string, SymbolBook> books_;
    std::unordered_map<OrderID, Location> locations_;

    template<typename Levels>
    static void remove_from(Levels& levels, const Location& location);

    template<typename Levels>
    static void collect(const Levels& levels, std::optional<Price> limit,
                        const std::function<bool(Price, Price)>& beyond, std::vector<OrderID>& out);

    template<typename Levels>
    static std::vector<BookLevel> aggregate(const Levels& levels, size_t depth);
};

} // namespace bourse
