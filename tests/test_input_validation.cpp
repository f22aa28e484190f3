#include <gtest/gtest.h>
#include "bourse/input_validation.hpp"
#include "bourse/logger.hpp"
#include "bourse/security_utils.hpp"
#include "bourse/uuid.hpp"
#include <cstdint>
#include <unordered_set>

using namespace bourse;

class InputValidationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::FATAL);
    }

    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }
};

TEST_F(InputValidationTest, QuantityMustBePositive) {
    EXPECT_TRUE(FieldValidators::validate_quantity(1).has_value());
    EXPECT_TRUE(FieldValidators::validate_quantity(0).has_error());
    EXPECT_TRUE(FieldValidators::validate_quantity(-5).has_error());
}

TEST_F(InputValidationTest, PriceRulesDependOnOrderType) {
    auto limit = FieldValidators::validate_price(OrderType::LIMIT, Price{10});
    ASSERT_TRUE(limit.has_value());
    EXPECT_EQ(limit.value(), Price{10});

    EXPECT_EQ(FieldValidators::validate_price(OrderType::LIMIT, std::nullopt).error(),
              make_error_code(ErrorCode::INVALID_PRICE));
    EXPECT_TRUE(FieldValidators::validate_price(OrderType::LIMIT, Price{0}).has_error());
    EXPECT_TRUE(FieldValidators::validate_price(OrderType::LIMIT, Price{-1}).has_error());

    auto market = FieldValidators::validate_price(OrderType::MARKET, Price{10});
    ASSERT_TRUE(market.has_value());
    EXPECT_FALSE(market.value().has_value());
}

TEST_F(InputValidationTest, TickerNormalization) {
    EXPECT_EQ(FieldValidators::validate_ticker("aapl").value(), "AAPL");
    EXPECT_EQ(FieldValidators::validate_ticker("Rub2").value(), "RUB2");
    EXPECT_TRUE(FieldValidators::validate_ticker("").has_error());
    EXPECT_TRUE(FieldValidators::validate_ticker("BTC-USD").has_error());
    EXPECT_TRUE(FieldValidators::validate_ticker("A B").has_error());
    EXPECT_TRUE(FieldValidators::validate_ticker(std::string(16, 'X')).has_value());
    EXPECT_TRUE(FieldValidators::validate_ticker(std::string(17, 'X')).has_error());
}

TEST_F(InputValidationTest, NamesAmountsAndLimits) {
    EXPECT_TRUE(FieldValidators::validate_name("Alice").has_value());
    EXPECT_TRUE(FieldValidators::validate_name("").has_error());
    EXPECT_TRUE(FieldValidators::validate_name("bad\nname").has_error());
    EXPECT_TRUE(FieldValidators::validate_name(std::string(129, 'a')).has_error());

    EXPECT_TRUE(FieldValidators::validate_amount(5).has_value());
    EXPECT_TRUE(FieldValidators::validate_amount(-5).has_value());
    EXPECT_TRUE(FieldValidators::validate_amount(0).has_error());

    EXPECT_TRUE(FieldValidators::validate_limit(1, 25).has_value());
    EXPECT_TRUE(FieldValidators::validate_limit(25, 25).has_value());
    EXPECT_TRUE(FieldValidators::validate_limit(0, 25).has_error());
    EXPECT_TRUE(FieldValidators::validate_limit(26, 25).has_error());
}

TEST_F(InputValidationTest, NotionalDetectsOverflow) {
    EXPECT_EQ(FieldValidators::notional(10, 12).value(), 120);
    EXPECT_EQ(FieldValidators::notional(INT64_MAX, 2).error(),
              make_error_code(ErrorCode::NOTIONAL_OVERFLOW));
}

TEST_F(InputValidationTest, LogSanitizationStripsControlCharacters) {
    EXPECT_EQ(SecurityUtils::sanitize_log_input("a\nb\rc"), "a\\nb\\rc");
    EXPECT_EQ(SecurityUtils::sanitize_log_input(std::string("x\x01y")), "xy");
    EXPECT_EQ(SecurityUtils::safe_format("{} bought {}", "bob", 5), "bob bought 5");
    EXPECT_EQ(SecurityUtils::safe_format("no slots", 1), "no slots 1");
}

TEST_F(InputValidationTest, UuidGenerationAndParsing) {
    auto generated = Uuid::generate();
    ASSERT_TRUE(generated.has_value());
    const Uuid& id = generated.value();
    EXPECT_FALSE(id.is_nil());

    auto text = id.to_string();
    ASSERT_EQ(text.size(), 36u);
    EXPECT_EQ(text[14], '4');

    auto parsed = Uuid::parse(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), id);

    EXPECT_EQ(Uuid::parse("not-a-uuid").error(), make_error_code(ErrorCode::INVALID_IDENTIFIER));
    EXPECT_EQ(Uuid::parse("123e4567-e89b-12d3-a456-42661417400g").kind(), ErrorKind::INVALID_INPUT);
    EXPECT_TRUE(Uuid().is_nil());
}

TEST_F(InputValidationTest, UuidsAreDistinct) {
    std::unordered_set<Uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(Uuid::generate().value()).second);
    }
}
