#include <deductly/core/money.hpp>
#include <gtest/gtest.h>

namespace dc = deductly::core;

TEST(Money, ParsesPlainDecimal) {
  auto m = dc::Money::parse("31.48");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->cents(), 3148);
  EXPECT_EQ(m->to_string(), "31.48");
}

TEST(Money, ParsesCurrencySymbolAndThousands) {
  auto m = dc::Money::parse("$1,234.56");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->cents(), 123456);
}

TEST(Money, PadsSingleFractionDigit) {
  EXPECT_EQ(dc::Money::parse("2.5")->cents(), 250);
  EXPECT_EQ(dc::Money::parse("7")->cents(), 700);
}

TEST(Money, RoundsHalfUpPastTwoDecimals) {
  EXPECT_EQ(dc::Money::parse("3.455")->cents(), 346);
  EXPECT_EQ(dc::Money::parse("3.454")->cents(), 345);
  EXPECT_EQ(dc::Money::parse("0.995")->cents(), 100);
}

TEST(Money, NegativeAmounts) {
  auto m = dc::Money::parse("-2.50");
  ASSERT_TRUE(m.has_value());
  EXPECT_TRUE(m->is_negative());
  EXPECT_EQ(m->to_string(), "-2.50");
}

TEST(Money, RejectsMalformed) {
  EXPECT_FALSE(dc::Money::parse("").has_value());
  EXPECT_FALSE(dc::Money::parse("$").has_value());
  EXPECT_FALSE(dc::Money::parse("abc").has_value());
  EXPECT_FALSE(dc::Money::parse("12,34").has_value());
  EXPECT_FALSE(dc::Money::parse("1234,567").has_value());
  EXPECT_FALSE(dc::Money::parse("1.2.3").has_value());
}

TEST(Money, ArithmeticAndOrdering) {
  const auto a = dc::Money::from_cents(1299);
  const auto b = dc::Money::from_cents(1599);
  EXPECT_EQ((a + b).cents(), 2898);
  EXPECT_EQ((b - a).to_string(), "3.00");
  EXPECT_LT(a, b);
  EXPECT_TRUE(dc::Money{}.is_zero());
  EXPECT_EQ(dc::Money{}.to_string(), "0.00");
}
