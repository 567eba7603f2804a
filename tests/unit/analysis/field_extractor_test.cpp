#include <deductly/analysis/field_extractor.hpp>
#include <deductly/core/money.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace da = deductly::analysis;
namespace dc = deductly::core;

using namespace std::chrono_literals;

namespace {

constexpr const char* kWalgreensReceipt =
    "WALGREENS\n"
    "Aspirin $12.99\n"
    "Cough Medicine $15.99\n"
    "Subtotal: $28.98\n"
    "Tax: $2.50\n"
    "Total: $31.48\n"
    "Date: 03/15/2025";

dc::Money cents(std::int64_t c) { return dc::Money::from_cents(c); }

}  // namespace

TEST(FieldExtractor, ExtractsWalgreensReceipt) {
  da::FieldExtractor extractor;
  const auto fields = extractor.extract(kWalgreensReceipt);

  EXPECT_EQ(fields.vendor_name, "Walgreens");
  EXPECT_EQ(fields.total_amount, cents(3148));
  ASSERT_TRUE(fields.tax_amount.has_value());
  EXPECT_EQ(*fields.tax_amount, cents(250));
  ASSERT_TRUE(fields.transaction_date.has_value());
  EXPECT_EQ(*fields.transaction_date, 2025y / std::chrono::March / 15d);
  ASSERT_EQ(fields.items.size(), 2u);
  EXPECT_EQ(fields.items[0].description, "Aspirin");
  EXPECT_EQ(fields.items[0].price, cents(1299));
  EXPECT_EQ(fields.items[1].description, "Cough Medicine");
  EXPECT_EQ(fields.items[1].price, cents(1599));

  EXPECT_TRUE(fields.has_vendor());
  EXPECT_TRUE(fields.has_amount());
  EXPECT_TRUE(fields.has_date());
  EXPECT_TRUE(fields.has_items());
}

TEST(FieldExtractor, TotalFallsBackToLargestCurrencyToken) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_total("Coffee $5.00\nMuffin $3.00\nGift card $12.00"),
            cents(1200));
}

TEST(FieldExtractor, TotalIgnoresSubtotalAndTaxLines) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_total("Item 1: $15.99\nItem 2: $20.00\nTax: $2.88\nTotal: $38.87"),
            cents(3887));
}

TEST(FieldExtractor, LastTotalLineWins) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_total("TOTAL 10.00\nCoupon -2.00\nTOTAL 8.00"), cents(800));
}

TEST(FieldExtractor, AmountDueAndBalanceLabels) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_total("Amount Due: 41.20\nCash 50.00"), cents(4120));
  EXPECT_EQ(extractor.extract_total("Balance Due $7.25"), cents(725));
}

TEST(FieldExtractor, TotalWithThousandsSeparator) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_total("TOTAL $1,234.56"), cents(123456));
}

TEST(FieldExtractor, TotalIsZeroWithoutAnyAmount) {
  da::FieldExtractor extractor;
  const auto fields = extractor.extract("Thank you for shopping");
  EXPECT_TRUE(fields.total_amount.is_zero());
  EXPECT_FALSE(fields.has_amount());
}

TEST(FieldExtractor, LabelWithoutCurrencyAmountIsNotATotal) {
  da::FieldExtractor extractor;
  const auto fields = extractor.extract("Corner Store\nThanks for visiting\nTOTAL 3 ITEMS");
  EXPECT_TRUE(fields.total_amount.is_zero());
  EXPECT_TRUE(fields.items.empty());

  EXPECT_EQ(extractor.extract_total("TOTAL 3 ITEMS\nCoffee 4.50"), cents(450));
}

TEST(FieldExtractor, OverlongLinesAreIgnored) {
  da::FieldExtractor extractor;
  const std::string padded_label = "TOTAL" + std::string(100000, ' ') + "5.00";
  const std::string digit_amount = std::string(100000, '1') + ".00";
  const std::string digit_run(100000, '7');

  for (const auto& line : {padded_label, digit_amount, digit_run}) {
    const auto fields = extractor.extract(line + "\nLatte $4.20\nDate: 03/15/2025");
    EXPECT_EQ(fields.total_amount, cents(420));
    EXPECT_EQ(fields.transaction_date, 2025y / std::chrono::March / 15d);
    ASSERT_EQ(fields.items.size(), 1u);
    EXPECT_EQ(fields.items[0].description, "Latte");
    EXPECT_FALSE(da::contains_date_token(line));
    EXPECT_TRUE(da::currency_tokens(line).empty());
  }
}

TEST(FieldExtractor, LongWhitespaceRunBetweenLinesDoesNotCrash) {
  da::FieldExtractor extractor;
  const std::string text = "TOTAL" + std::string(50000, '\n') + "5.00";
  EXPECT_EQ(extractor.extract_total(text), cents(500));
}

TEST(FieldExtractor, TaxAbsentIsDistinctFromZero) {
  da::FieldExtractor extractor;
  EXPECT_FALSE(extractor.extract_tax("Total: $5.00").has_value());

  auto zero = extractor.extract_tax("Tax: $0.00\nTotal: $5.00");
  ASSERT_TRUE(zero.has_value());
  EXPECT_TRUE(zero->is_zero());
}

TEST(FieldExtractor, SalesTaxLabel) {
  da::FieldExtractor extractor;
  auto tax = extractor.extract_tax("Subtotal: $42.49\nSales Tax: $3.50\nTotal: $45.99");
  ASSERT_TRUE(tax.has_value());
  EXPECT_EQ(*tax, cents(350));
}

TEST(FieldExtractor, TaxRateIsSkippedForTaxAmount) {
  da::FieldExtractor extractor;
  auto tax = extractor.extract_tax("Subtotal 10.06\nTax 8.25% $0.83\nTotal 10.89");
  ASSERT_TRUE(tax.has_value());
  EXPECT_EQ(*tax, cents(83));
}

TEST(FieldExtractor, NumericDateForms) {
  da::FieldExtractor extractor;
  const auto expected = 2025y / std::chrono::March / 15d;

  EXPECT_EQ(extractor.extract_date("Date: 03/15/2025"), expected);
  EXPECT_EQ(extractor.extract_date("15/03/2025"), expected);
  EXPECT_EQ(extractor.extract_date("03-15-25"), expected);
  EXPECT_EQ(extractor.extract_date("2025-03-15 14:02"), expected);
}

TEST(FieldExtractor, MonthNameDateForms) {
  da::FieldExtractor extractor;
  const auto expected = 2025y / std::chrono::March / 15d;

  EXPECT_EQ(extractor.extract_date("Mar 15, 2025"), expected);
  EXPECT_EQ(extractor.extract_date("March 15th 2025"), expected);
  EXPECT_EQ(extractor.extract_date("15-Mar-2025"), expected);
  EXPECT_EQ(extractor.extract_date("Sept 1, 2024"), 2024y / std::chrono::September / 1d);
}

TEST(FieldExtractor, AmbiguousNumericDateReadsMonthFirst) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_date("03/04/2025"), 2025y / std::chrono::March / 4d);
}

TEST(FieldExtractor, RejectsInvalidAndOutOfWindowDates) {
  da::FieldExtractor extractor;
  EXPECT_FALSE(extractor.extract_date("02/30/2025").has_value());
  EXPECT_FALSE(extractor.extract_date("01/01/1999").has_value());
  EXPECT_FALSE(extractor.extract_date("no date here").has_value());
}

TEST(FieldExtractor, SkipsInvalidCandidateAndKeepsSearching) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_date("Ref 99/99/2025\nDate: 03/15/2025"),
            2025y / std::chrono::March / 15d);
}

TEST(FieldExtractor, YearWindowIsConfigurable) {
  da::ExtractionOptions options;
  options.min_year = 1990;
  da::FieldExtractor extractor(options);
  EXPECT_EQ(extractor.extract_date("01/01/1999"), 1999y / std::chrono::January / 1d);
}

TEST(FieldExtractor, SpecificVendorRuleBeatsGenericOne) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_vendor("CVS Pharmacy\nTotal 5.00"), "CVS");
  EXPECT_EQ(extractor.extract_vendor("Main Street Pharmacy\nWalgreens Rewards\nTotal 5.00"),
            "Walgreens");
  EXPECT_EQ(extractor.extract_vendor("SHELL\nFuel 40.00"), "Shell");
}

TEST(FieldExtractor, VendorRulesOnlySeeFirstFiveLines) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_vendor("Corner Cafe\na\nb\nc\nd\nWalgreens"), "Corner Cafe");
}

TEST(FieldExtractor, HeaderLineFallback) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_vendor("joe's diner #123\nBurger 9.50"), "Joe's Diner");
  EXPECT_EQ(extractor.extract_vendor("CORNER CAFE STORE 42\nLatte 4.50"), "Corner Cafe");
  EXPECT_EQ(extractor.extract_vendor("$5.00\nTOTAL 5.00\n12345\nBlue Door Books"),
            "Blue Door Books");
}

TEST(FieldExtractor, HeaderStartingWithTotalAsPartOfAWordIsAVendor) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_vendor("Totally Bagels\nEverything bagel 2.50"), "Totally Bagels");
  EXPECT_EQ(extractor.extract_vendor("Total: 2.50\nTotally Bagels"), "Totally Bagels");
}

TEST(FieldExtractor, UnknownVendorWithoutUsableHeader) {
  da::FieldExtractor extractor;
  EXPECT_EQ(extractor.extract_vendor(""), da::kUnknownVendor);
  EXPECT_EQ(extractor.extract_vendor("$5.00\n12.00"), da::kUnknownVendor);
  EXPECT_FALSE(extractor.extract("").has_vendor());
}

TEST(FieldExtractor, VendorRuleOrderIsStable) {
  da::FieldExtractor extractor;
  const auto& rules = extractor.vendor_rules();
  ASSERT_FALSE(rules.empty());
  EXPECT_EQ(rules.rule(0).name, "walgreens");
  EXPECT_EQ(rules.rule(rules.size() - 1).name, "gas_station");
}

TEST(FieldExtractor, ItemsStripSeparatorsAroundPrice) {
  da::FieldExtractor extractor;
  const auto items = extractor.extract_items(
      "WALGREENS\nItem 1: Aspirin - $12.99\nItem 2: Cough Medicine - $15.99\n"
      "Item 3: Vitamins - $14.01\nSubtotal: $42.99\nTax: $3.50\nTotal: $45.99");
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].description, "Item 1: Aspirin");
  EXPECT_EQ(items[2].price, cents(1401));
}

TEST(FieldExtractor, SummaryLinesBecomeItemsWhenNotExcluded) {
  da::ExtractionOptions options;
  options.exclude_summary_lines = false;
  da::FieldExtractor extractor(options);
  const auto items = extractor.extract_items(kWalgreensReceipt);
  ASSERT_EQ(items.size(), 5u);
  EXPECT_EQ(items[2].description, "Subtotal");
  EXPECT_EQ(items[4].description, "Total");
  EXPECT_EQ(items[4].price, cents(3148));
}

TEST(FieldExtractor, LinesWithoutDescriptionAreNotItems) {
  da::FieldExtractor extractor;
  EXPECT_TRUE(extractor.extract_items("$12.99\n  - 4.00").empty());
}

TEST(FieldExtractor, DeduplicatesItemsWhenEnabled) {
  constexpr const char* text = "Aspirin 12.99\nAspirin 12.99\nCough Medicine 15.99";

  da::FieldExtractor keep_all;
  EXPECT_EQ(keep_all.extract_items(text).size(), 3u);

  da::ExtractionOptions options;
  options.deduplicate_items = true;
  da::FieldExtractor dedupe(options);
  const auto items = dedupe.extract_items(text);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[1].description, "Cough Medicine");
}

TEST(FieldExtractor, DeduplicateKeepsSameNameWithDifferentPrice) {
  std::vector<dc::LineItem> items = {
      {"Aspirin", cents(1299)}, {"Aspirin", cents(1299)}, {"Aspirin", cents(899)}};
  EXPECT_EQ(da::deduplicate_items(items).size(), 2u);
}

TEST(ParseCurrency, AcceptsReceiptAmounts) {
  EXPECT_EQ(da::parse_currency("$45.99"), cents(4599));
  EXPECT_EQ(da::parse_currency("$1,234.56"), cents(123456));
  EXPECT_EQ(da::parse_currency("$0.99"), cents(99));
  EXPECT_EQ(da::parse_currency("$10000.00"), cents(1000000));
  EXPECT_EQ(da::parse_currency(" $ 12.50 "), cents(1250));
}

TEST(ParseCurrency, RejectsNonAmounts) {
  EXPECT_FALSE(da::parse_currency("").has_value());
  EXPECT_FALSE(da::parse_currency("abc").has_value());
  EXPECT_FALSE(da::parse_currency("12.3.4").has_value());
}

TEST(CurrencyTokens, FindsTwoDecimalAmountsInOrder) {
  const auto tokens = da::currency_tokens("a $5.00 b 3.00 c $1,200.50 d 7 e 2025");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], cents(500));
  EXPECT_EQ(tokens[1], cents(300));
  EXPECT_EQ(tokens[2], cents(120050));
}

TEST(ContainsDateToken, NumericDatesOnly) {
  EXPECT_TRUE(da::contains_date_token("Date: 03/15/2025"));
  EXPECT_TRUE(da::contains_date_token("2025-03-15"));
  EXPECT_FALSE(da::contains_date_token("Mar 15, 2025"));
  EXPECT_FALSE(da::contains_date_token("Total 31.48"));
}
