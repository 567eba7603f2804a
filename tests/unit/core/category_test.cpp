#include <deductly/core/category.hpp>
#include <gtest/gtest.h>

namespace dc = deductly::core;

TEST(Category, CanonicalNames) {
  EXPECT_EQ(dc::to_string(dc::Category::Medical), "medical");
  EXPECT_EQ(dc::to_string(dc::Category::HomeOffice), "home_office");
  EXPECT_EQ(dc::to_string(dc::Category::StateLocal), "state_local");
  EXPECT_EQ(dc::to_string(dc::Category::Miscellaneous), "miscellaneous");
}

TEST(Category, ParseRoundTripsEveryCategory) {
  for (auto c : dc::kAllCategories) {
    auto parsed = dc::parse_category(dc::to_string(c));
    ASSERT_TRUE(parsed.has_value()) << dc::to_string(c);
    EXPECT_EQ(*parsed, c);
  }
}

TEST(Category, ParseIsCaseInsensitive) {
  EXPECT_EQ(dc::parse_category("Vehicle"), dc::Category::Vehicle);
  EXPECT_EQ(dc::parse_category("HOME_OFFICE"), dc::Category::HomeOffice);
}

TEST(Category, UnknownNameIsAbsent) {
  EXPECT_FALSE(dc::parse_category("groceries").has_value());
  EXPECT_FALSE(dc::parse_category("").has_value());
}

TEST(Category, OutOfRangeValueIsUnknown) {
  EXPECT_TRUE(dc::is_known_category(dc::Category::Energy));
  EXPECT_FALSE(dc::is_known_category(static_cast<dc::Category>(42)));
  EXPECT_EQ(dc::to_string(static_cast<dc::Category>(42)), "");
}
