#include <gtest/gtest.h>
#include "bourse/logger.hpp"
#include "bourse/matching_engine.hpp"
#include <functional>
#include <memory>
#include <numeric>

using namespace bourse;

namespace {

// In-memory store whose writes can be switched to persistent conflicts.
// `on_next_find` runs once, right after the next balance read.
class SwitchableLedgerStore : public InMemoryLedgerStore {
public:
    Result<Amount> upsert_increment(const BalanceKey& key, Amount delta) override {
        if (conflicting) {
            return ErrorCode::STORE_TRANSIENT_CONFLICT;
        }
        return InMemoryLedgerStore::upsert_increment(key, delta);
    }

    std::optional<BalanceRecord> find(const BalanceKey& key) const override {
        auto record = InMemoryLedgerStore::find(key);
        if (on_next_find) {
            auto hook = std::move(on_next_find);
            on_next_find = nullptr;
            hook();
        }
        return record;
    }

    bool conflicting = false;
    mutable std::function<void()> on_next_find;
};

} // namespace

class MatchingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::FATAL);

        RetryPolicy retry(3);
        retry.set_sleeper([](std::chrono::milliseconds) {});
        ledger = std::make_unique<Ledger>(store, gate, retry);

        ASSERT_TRUE(instruments.add("RUB", "CURRENCY").has_value());
        ASSERT_TRUE(instruments.add("TEST", "EQUITY").has_value());

        risk = std::make_unique<RiskManager>(config, instruments, users, *ledger);
        engine = std::make_unique<MatchingEngine>(config, gate, *ledger, orders, trades, *risk);

        alice = users.create("alice").value().id;
        bob = users.create("bob").value().id;
        carol = users.create("carol").value().id;
    }

    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }

    void fund(const UserID& user, const std::string& ticker, Amount amount) {
        auto lock = gate.exclusive();
        ASSERT_TRUE(ledger->apply_delta(BalanceKey{user, ticker}, amount).has_value());
    }

    Amount balance(const UserID& user, const std::string& ticker) {
        return ledger->get_balance(user, ticker);
    }

    Result<Order> limit(const UserID& user, Side side, Quantity quantity, Price price,
                        const std::string& ticker = "TEST") {
        return engine->submit_order(OrderRequest{user, ticker, side, OrderType::LIMIT, quantity, price});
    }

    Result<Order> market(const UserID& user, Side side, Quantity quantity,
                         const std::string& ticker = "TEST") {
        return engine->submit_order(OrderRequest{user, ticker, side, OrderType::MARKET, quantity, std::nullopt});
    }

    Order stored(const OrderID& id) {
        auto order = orders.find(id);
        EXPECT_TRUE(order.has_value());
        return order.value_or(Order{});
    }

    EngineConfig config;
    SettlementGate gate;
    SwitchableLedgerStore store;
    std::unique_ptr<Ledger> ledger;
    OrderStore orders;
    TradeLog trades;
    InstrumentRegistry instruments;
    UserRegistry users;
    std::unique_ptr<RiskManager> risk;
    std::unique_ptr<MatchingEngine> engine;

    UserID alice;
    UserID bob;
    UserID carol;
};

TEST_F(MatchingEngineTest, LimitSellThenMarketBuySettles) {
    fund(alice, "RUB", 1000);
    fund(alice, "TEST", 100);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());
    EXPECT_EQ(sell.value().status, OrderStatus::NEW);
    EXPECT_EQ(orders.book("TEST", 10).asks[0], (BookLevel{10, 10}));

    auto buy = market(bob, Side::BUY, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);
    EXPECT_EQ(buy.value().filled_quantity, 10);

    auto recent = trades.recent("TEST", 10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].price, 10);
    EXPECT_EQ(recent[0].quantity, 10);
    EXPECT_EQ(recent[0].buy_order_id, buy.value().id);
    EXPECT_EQ(recent[0].sell_order_id, sell.value().id);

    EXPECT_EQ(balance(alice, "TEST"), 90);
    EXPECT_EQ(balance(alice, "RUB"), 1100);
    EXPECT_EQ(balance(bob, "TEST"), 10);
    EXPECT_EQ(balance(bob, "RUB"), 900);

    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::EXECUTED);
    auto book = orders.book("TEST", 10);
    EXPECT_TRUE(book.bids.empty());
    EXPECT_TRUE(book.asks.empty());
}

TEST_F(MatchingEngineTest, MarketBuyOnEmptyBookIsCancelled) {
    fund(bob, "RUB", 1000);

    auto buy = market(bob, Side::BUY, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::CANCELLED);
    EXPECT_EQ(buy.value().filled_quantity, 0);
    EXPECT_EQ(balance(bob, "RUB"), 1000);
    EXPECT_EQ(balance(bob, "TEST"), 0);
    EXPECT_EQ(trades.size(), 0u);
    EXPECT_EQ(orders.resting_count(), 0u);
}

TEST_F(MatchingEngineTest, UnaffordableLimitIsRejectedBeforeCreation) {
    fund(bob, "RUB", 99);

    auto buy = limit(bob, Side::BUY, 10, 10);
    ASSERT_TRUE(buy.has_error());
    EXPECT_EQ(buy.kind(), ErrorKind::INSUFFICIENT_FUNDS);

    auto sell = limit(alice, Side::SELL, 1, 10);
    ASSERT_TRUE(sell.has_error());
    EXPECT_EQ(sell.kind(), ErrorKind::INSUFFICIENT_FUNDS);

    EXPECT_EQ(orders.size(), 0u);
    EXPECT_EQ(balance(bob, "RUB"), 99);
    EXPECT_EQ(engine->orders_rejected(), 2u);
}

TEST_F(MatchingEngineTest, CancelPartiallyExecutedRemovesRemainder) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());
    auto buy = limit(bob, Side::BUY, 4, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);

    auto maker = stored(sell.value().id);
    EXPECT_EQ(maker.status, OrderStatus::PARTIALLY_EXECUTED);
    EXPECT_EQ(maker.filled_quantity, 4);
    EXPECT_EQ(orders.book("TEST", 10).asks[0], (BookLevel{10, 6}));

    auto cancelled = engine->cancel_order(sell.value().id, alice);
    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(cancelled.value().status, OrderStatus::CANCELLED);
    EXPECT_EQ(cancelled.value().filled_quantity, 4);
    EXPECT_TRUE(orders.book("TEST", 10).asks.empty());
}

TEST_F(MatchingEngineTest, PriceThenTimePriority) {
    fund(alice, "TEST", 100);
    fund(carol, "TEST", 100);
    fund(bob, "RUB", 10000);

    auto first = limit(alice, Side::SELL, 5, 10);
    auto same_price_later = limit(carol, Side::SELL, 5, 10);
    auto dearer = limit(alice, Side::SELL, 5, 12);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(same_price_later.has_value());
    ASSERT_TRUE(dearer.has_value());

    auto buy = market(bob, Side::BUY, 8);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);

    auto fills = trades.for_order(buy.value().id);
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0].sell_order_id, first.value().id);
    EXPECT_EQ(fills[0].quantity, 5);
    EXPECT_EQ(fills[1].sell_order_id, same_price_later.value().id);
    EXPECT_EQ(fills[1].quantity, 3);

    EXPECT_EQ(stored(first.value().id).status, OrderStatus::EXECUTED);
    EXPECT_EQ(stored(same_price_later.value().id).status, OrderStatus::PARTIALLY_EXECUTED);
    EXPECT_EQ(stored(dearer.value().id).filled_quantity, 0);
    EXPECT_EQ(balance(bob, "RUB"), 10000 - 80);
}

TEST_F(MatchingEngineTest, LimitTakerRestsRemainderAtItsPrice) {
    fund(alice, "TEST", 100);
    fund(bob, "RUB", 1000);

    ASSERT_TRUE(limit(alice, Side::SELL, 5, 10).has_value());
    ASSERT_TRUE(limit(alice, Side::SELL, 5, 12).has_value());

    auto buy = limit(bob, Side::BUY, 8, 11);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::PARTIALLY_EXECUTED);
    EXPECT_EQ(buy.value().filled_quantity, 5);

    auto book = orders.book("TEST", 10);
    ASSERT_EQ(book.bids.size(), 1u);
    EXPECT_EQ(book.bids[0], (BookLevel{11, 3}));
    ASSERT_EQ(book.asks.size(), 1u);
    EXPECT_EQ(book.asks[0], (BookLevel{12, 5}));
}

TEST_F(MatchingEngineTest, ExecutionUsesMakerPrice) {
    fund(bob, "RUB", 1000);
    fund(alice, "TEST", 10);

    ASSERT_TRUE(limit(bob, Side::BUY, 5, 10).has_value());
    auto sell = limit(alice, Side::SELL, 5, 8);
    ASSERT_TRUE(sell.has_value());
    EXPECT_EQ(sell.value().status, OrderStatus::EXECUTED);

    auto recent = trades.recent("TEST", 1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].price, 10);
    EXPECT_EQ(balance(alice, "RUB"), 50);
    EXPECT_EQ(balance(bob, "RUB"), 950);
}

TEST_F(MatchingEngineTest, UnfilledLimitStaysNew) {
    fund(bob, "RUB", 1000);
    auto buy = limit(bob, Side::BUY, 5, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::NEW);
    EXPECT_EQ(orders.book("TEST", 10).bids[0], (BookLevel{10, 5}));
    EXPECT_EQ(balance(bob, "RUB"), 1000);
}

TEST_F(MatchingEngineTest, CancellationConflicts) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 5, 10);
    ASSERT_TRUE(sell.has_value());
    auto buy = market(bob, Side::BUY, 5);
    ASSERT_TRUE(buy.has_value());

    auto executed = engine->cancel_order(sell.value().id, alice);
    ASSERT_TRUE(executed.has_error());
    EXPECT_EQ(executed.error(), make_error_code(ErrorCode::ORDER_NOT_CANCELLABLE));
    EXPECT_EQ(executed.kind(), ErrorKind::CONFLICT);

    auto market_order = engine->cancel_order(buy.value().id, bob);
    EXPECT_EQ(market_order.kind(), ErrorKind::CONFLICT);

    auto resting = limit(alice, Side::SELL, 2, 20);
    ASSERT_TRUE(resting.has_value());
    ASSERT_TRUE(engine->cancel_order(resting.value().id, alice).has_value());
    auto twice = engine->cancel_order(resting.value().id, alice);
    EXPECT_EQ(twice.kind(), ErrorKind::CONFLICT);
    EXPECT_EQ(stored(resting.value().id).status, OrderStatus::CANCELLED);
}

TEST_F(MatchingEngineTest, CancelOfOthersOrderIsNotFound) {
    fund(alice, "TEST", 10);
    auto sell = limit(alice, Side::SELL, 5, 10);
    ASSERT_TRUE(sell.has_value());

    auto foreign = engine->cancel_order(sell.value().id, bob);
    EXPECT_EQ(foreign.error(), make_error_code(ErrorCode::ORDER_NOT_FOUND));

    auto unknown = engine->cancel_order(Uuid::generate().value(), alice);
    EXPECT_EQ(unknown.kind(), ErrorKind::NOT_FOUND);

    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::NEW);
}

TEST_F(MatchingEngineTest, InputValidation) {
    fund(bob, "RUB", 1000);

    EXPECT_EQ(limit(bob, Side::BUY, 1, 1, "NOPE").error(),
              make_error_code(ErrorCode::INSTRUMENT_NOT_FOUND));
    EXPECT_EQ(limit(bob, Side::BUY, 0, 1).error(), make_error_code(ErrorCode::INVALID_QUANTITY));
    EXPECT_EQ(limit(bob, Side::BUY, -3, 1).error(), make_error_code(ErrorCode::INVALID_QUANTITY));
    EXPECT_EQ(limit(bob, Side::BUY, 1, 0).error(), make_error_code(ErrorCode::INVALID_PRICE));

    auto no_price = engine->submit_order(OrderRequest{bob, "TEST", Side::BUY, OrderType::LIMIT, 1, std::nullopt});
    EXPECT_EQ(no_price.error(), make_error_code(ErrorCode::INVALID_PRICE));

    auto stranger = limit(Uuid::generate().value(), Side::BUY, 1, 1);
    EXPECT_EQ(stranger.error(), make_error_code(ErrorCode::USER_NOT_FOUND));

    auto overflow = limit(bob, Side::BUY, INT64_MAX, 2);
    EXPECT_EQ(overflow.error(), make_error_code(ErrorCode::NOTIONAL_OVERFLOW));

    EXPECT_EQ(orders.size(), 0u);
}

TEST_F(MatchingEngineTest, TickerIsNormalizedAndMarketPriceDropped) {
    fund(bob, "RUB", 1000);

    auto lower = limit(bob, Side::BUY, 1, 5, "test");
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(lower.value().ticker, "TEST");

    auto priced_market = engine->submit_order(OrderRequest{bob, "TEST", Side::BUY, OrderType::MARKET, 1, Price{7}});
    ASSERT_TRUE(priced_market.has_value());
    EXPECT_FALSE(priced_market.value().price.has_value());
    EXPECT_EQ(priced_market.value().status, OrderStatus::CANCELLED);
}

TEST_F(MatchingEngineTest, UnderfundedMarketBuyFillsWhatItCanPay) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 50);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());

    // Pre-check costs the order at 1 per unit, settlement at the real price
    auto buy = market(bob, Side::BUY, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);
    EXPECT_EQ(buy.value().filled_quantity, 5);

    EXPECT_EQ(balance(bob, "RUB"), 0);
    EXPECT_EQ(balance(bob, "TEST"), 5);
    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::PARTIALLY_EXECUTED);
    EXPECT_EQ(orders.book("TEST", 10).asks[0], (BookLevel{10, 5}));
}

TEST_F(MatchingEngineTest, MarketBuyThatCannotAffordOneUnitIsCancelled) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 5);

    ASSERT_TRUE(limit(alice, Side::SELL, 10, 10).has_value());
    auto buy = market(bob, Side::BUY, 5);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::CANCELLED);
    EXPECT_EQ(balance(bob, "RUB"), 5);
}

TEST_F(MatchingEngineTest, MakerThatCannotSettleIsCancelled) {
    fund(alice, "TEST", 5);
    fund(carol, "TEST", 5);
    fund(bob, "RUB", 1000);

    auto stale = limit(alice, Side::SELL, 5, 10);
    ASSERT_TRUE(stale.has_value());
    auto next = limit(carol, Side::SELL, 5, 11);
    ASSERT_TRUE(next.has_value());

    // Alice's asset leaves after her order rested
    fund(alice, "TEST", -5);

    auto buy = market(bob, Side::BUY, 5);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);

    auto fills = trades.for_order(buy.value().id);
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].sell_order_id, next.value().id);
    EXPECT_EQ(stored(stale.value().id).status, OrderStatus::CANCELLED);
    EXPECT_EQ(stored(stale.value().id).filled_quantity, 0);
    EXPECT_TRUE(orders.book("TEST", 10).asks.empty());
    EXPECT_EQ(balance(alice, "TEST"), 0);
}

TEST_F(MatchingEngineTest, UnbackedMakerDoesNotLeaveBookCrossed) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());
    fund(alice, "TEST", -10);

    auto buy = limit(bob, Side::BUY, 10, 12);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::NEW);
    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::CANCELLED);

    auto book = orders.book("TEST", 10);
    EXPECT_TRUE(book.asks.empty());
    ASSERT_EQ(book.bids.size(), 1u);
    EXPECT_EQ(book.bids[0], (BookLevel{12, 10}));
    EXPECT_EQ(trades.size(), 0u);
    EXPECT_EQ(balance(bob, "RUB"), 1000);
}

TEST_F(MatchingEngineTest, MakerShortOfItsRemainderIsCancelledAfterFill) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());
    fund(alice, "TEST", -6);

    auto buy = limit(bob, Side::BUY, 10, 12);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::PARTIALLY_EXECUTED);
    EXPECT_EQ(buy.value().filled_quantity, 4);

    auto maker = stored(sell.value().id);
    EXPECT_EQ(maker.status, OrderStatus::CANCELLED);
    EXPECT_EQ(maker.filled_quantity, 4);

    auto book = orders.book("TEST", 10);
    EXPECT_TRUE(book.asks.empty());
    ASSERT_EQ(book.bids.size(), 1u);
    EXPECT_EQ(book.bids[0], (BookLevel{12, 6}));
    EXPECT_EQ(balance(alice, "TEST"), 0);
    EXPECT_EQ(balance(alice, "RUB"), 40);
    EXPECT_EQ(balance(bob, "TEST"), 4);
}

TEST_F(MatchingEngineTest, LimitTakerThatRunsOutOfFundsIsCancelled) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 100);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());

    // Bob's funds shrink between the affordability check and settlement
    store.on_next_find = [this]() { fund(bob, "RUB", -60); };
    auto buy = limit(bob, Side::BUY, 10, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy.value().status, OrderStatus::CANCELLED);
    EXPECT_EQ(buy.value().filled_quantity, 4);

    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::PARTIALLY_EXECUTED);
    auto book = orders.book("TEST", 10);
    EXPECT_TRUE(book.bids.empty());
    ASSERT_EQ(book.asks.size(), 1u);
    EXPECT_EQ(book.asks[0], (BookLevel{10, 6}));
    EXPECT_EQ(balance(bob, "RUB"), 0);
    EXPECT_EQ(balance(bob, "TEST"), 4);
}

TEST_F(MatchingEngineTest, InstrumentDelistedAfterValidationFailsSubmission) {
    fund(bob, "RUB", 1000);

    store.on_next_find = [this]() { ASSERT_TRUE(instruments.remove("TEST").has_value()); };
    auto buy = limit(bob, Side::BUY, 10, 10);
    ASSERT_TRUE(buy.has_error());
    EXPECT_EQ(buy.error(), make_error_code(ErrorCode::INSTRUMENT_NOT_FOUND));
    EXPECT_EQ(orders.size(), 0u);
    EXPECT_EQ(orders.resting_count(), 0u);
    EXPECT_EQ(engine->orders_rejected(), 1u);
}

TEST_F(MatchingEngineTest, UserDeletedAfterValidationFailsSubmission) {
    fund(alice, "TEST", 10);

    store.on_next_find = [this]() { ASSERT_TRUE(users.remove(alice).has_value()); };
    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_error());
    EXPECT_EQ(sell.error(), make_error_code(ErrorCode::USER_NOT_FOUND));
    EXPECT_EQ(orders.size(), 0u);
}

TEST_F(MatchingEngineTest, SelfTradeIsAllowed) {
    fund(alice, "TEST", 5);
    fund(alice, "RUB", 100);

    auto sell = limit(alice, Side::SELL, 5, 10);
    ASSERT_TRUE(sell.has_value());
    auto buy = limit(alice, Side::BUY, 5, 10);
    ASSERT_TRUE(buy.has_value());

    EXPECT_EQ(buy.value().status, OrderStatus::EXECUTED);
    EXPECT_EQ(stored(sell.value().id).status, OrderStatus::EXECUTED);
    EXPECT_EQ(trades.size(), 1u);
    EXPECT_EQ(balance(alice, "TEST"), 5);
    EXPECT_EQ(balance(alice, "RUB"), 100);
}

TEST_F(MatchingEngineTest, SettlementFailureRollsBackWholeSubmission) {
    fund(alice, "TEST", 10);
    fund(bob, "RUB", 1000);

    auto sell = limit(alice, Side::SELL, 10, 10);
    ASSERT_TRUE(sell.has_value());

    store.conflicting = true;
    auto buy = market(bob, Side::BUY, 10);
    store.conflicting = false;

    ASSERT_TRUE(buy.has_error());
    EXPECT_EQ(buy.error(), make_error_code(ErrorCode::STORE_RETRIES_EXHAUSTED));
    EXPECT_EQ(buy.kind(), ErrorKind::TRANSIENT_STORE_CONFLICT);

    EXPECT_EQ(orders.size(), 1u);
    EXPECT_EQ(trades.size(), 0u);
    auto maker = stored(sell.value().id);
    EXPECT_EQ(maker.status, OrderStatus::NEW);
    EXPECT_EQ(maker.filled_quantity, 0);
    EXPECT_EQ(orders.book("TEST", 10).asks[0], (BookLevel{10, 10}));
    EXPECT_EQ(balance(alice, "TEST"), 10);
    EXPECT_EQ(balance(alice, "RUB"), 0);
    EXPECT_EQ(balance(bob, "RUB"), 1000);
    EXPECT_FALSE(store.find(BalanceKey{bob, "TEST"}).has_value());
    EXPECT_EQ(engine->rollbacks(), 1u);
}

TEST_F(MatchingEngineTest, TradesConserveValue) {
    fund(alice, "TEST", 50);
    fund(alice, "RUB", 500);
    fund(bob, "TEST", 50);
    fund(bob, "RUB", 500);
    fund(carol, "RUB", 500);

    ASSERT_TRUE(limit(alice, Side::SELL, 20, 9).has_value());
    ASSERT_TRUE(limit(bob, Side::SELL, 20, 11).has_value());
    ASSERT_TRUE(limit(carol, Side::BUY, 30, 10).has_value());
    ASSERT_TRUE(market(carol, Side::BUY, 15).has_value());
    ASSERT_TRUE(limit(alice, Side::BUY, 10, 12).has_value());
    ASSERT_TRUE(market(bob, Side::SELL, 25).has_value());

    Amount rub = balance(alice, "RUB") + balance(bob, "RUB") + balance(carol, "RUB");
    Amount asset = balance(alice, "TEST") + balance(bob, "TEST") + balance(carol, "TEST");
    EXPECT_EQ(rub, 1500);
    EXPECT_EQ(asset, 100);

    for (const auto& user : {alice, bob, carol}) {
        EXPECT_GE(balance(user, "RUB"), 0);
        EXPECT_GE(balance(user, "TEST"), 0);
        for (const auto& order : orders.orders_of(user)) {
            EXPECT_GE(order.filled_quantity, 0);
            EXPECT_LE(order.filled_quantity, order.quantity);
            if (order.type == OrderType::LIMIT) {
                EXPECT_EQ(order.status == OrderStatus::EXECUTED, order.filled_quantity == order.quantity);
            }
        }
    }
    EXPECT_GT(engine->trades_executed(), 0u);
}
