#include <deductly/core/receipt.hpp>
#include <deductly/core/serialization.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace dc = deductly::core;
using namespace std::chrono;

namespace {

dc::ReceiptRecord sample_record() {
  dc::ReceiptRecord r;
  r.vendor_name = "Walgreens";
  r.total_amount = dc::Money::from_cents(3148);
  r.tax_amount = dc::Money::from_cents(250);
  r.transaction_date = year{2025} / March / 15;
  r.items = {{"Aspirin", dc::Money::from_cents(1299)},
             {"Cough Medicine", dc::Money::from_cents(1599)}};
  r.category = dc::Category::Medical;
  r.confidence_score = 0.85f;
  r.raw_text = "WALGREENS\nTotal: $31.48\n";
  r.extracted_at = dc::Timestamp{milliseconds{1742036645123}};
  return r;
}

}  // namespace

TEST(Serialization, FlatLayoutWithDecimalStrings) {
  const nlohmann::json j = sample_record();
  EXPECT_EQ(j.at("vendor_name"), "Walgreens");
  EXPECT_EQ(j.at("total_amount"), "31.48");
  EXPECT_EQ(j.at("tax_amount"), "2.50");
  EXPECT_EQ(j.at("transaction_date"), "2025-03-15");
  EXPECT_EQ(j.at("category"), "medical");
  ASSERT_EQ(j.at("items").size(), 2u);
  EXPECT_EQ(j.at("items")[0].at("price"), "12.99");
  EXPECT_EQ(j.at("extracted_at"), "2025-03-15T11:04:05.123Z");
}

TEST(Serialization, RoundTripIsFieldForFieldEqual) {
  const auto original = sample_record();
  auto parsed = dc::deserialize_record(dc::serialize_record(original));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, original);
}

TEST(Serialization, InvalidUtf8IsReplacedNotThrown) {
  auto r = sample_record();
  r.vendor_name = "Caf\xE9 Roma";
  r.items[0].description = "Cr\xE8me";
  r.raw_text = "CAF\xC9 ROMA\nTotal: $31.48\n";

  std::string text;
  ASSERT_NO_THROW(text = dc::serialize_record(r));
  auto parsed = dc::deserialize_record(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->vendor_name, "Caf\xEF\xBF\xBD Roma");
  EXPECT_EQ(parsed->items[0].description, "Cr\xEF\xBF\xBDme");
  EXPECT_EQ(parsed->total_amount, r.total_amount);
}

TEST(Serialization, AbsentTaxAndDateAreNull) {
  auto r = sample_record();
  r.tax_amount.reset();
  r.transaction_date.reset();
  const nlohmann::json j = r;
  EXPECT_TRUE(j.at("tax_amount").is_null());
  EXPECT_TRUE(j.at("transaction_date").is_null());

  auto parsed = dc::deserialize_record(j.dump());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(parsed->tax_amount.has_value());
  EXPECT_FALSE(parsed->transaction_date.has_value());
}

TEST(Serialization, MalformedInputIsRejected) {
  EXPECT_FALSE(dc::deserialize_record("not json").has_value());
  EXPECT_FALSE(dc::deserialize_record("{}").has_value());

  nlohmann::json j = sample_record();
  j["category"] = "groceries";
  EXPECT_FALSE(dc::deserialize_record(j.dump()).has_value());

  j = sample_record();
  j["total_amount"] = "12.3.4";
  EXPECT_FALSE(dc::deserialize_record(j.dump()).has_value());

  j = sample_record();
  j["transaction_date"] = "2025-02-30";
  EXPECT_FALSE(dc::deserialize_record(j.dump()).has_value());
}

TEST(Serialization, DateHelpers) {
  EXPECT_EQ(dc::format_date(year{2025} / January / 5), "2025-01-05");
  auto d = dc::parse_date("2024-02-29");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, year{2024} / February / 29);
  EXPECT_FALSE(dc::parse_date("2023-02-29").has_value());
  EXPECT_FALSE(dc::parse_date("03/15/2025").has_value());
}

TEST(Serialization, ScanResultFailureHasNoRecord) {
  dc::ScanResult result;
  result.success = false;
  result.error = dc::ScanError::NoTextExtracted;
  result.error_message = "No text could be extracted from the image";
  const nlohmann::json j = result;
  EXPECT_FALSE(j.at("success").get<bool>());
  EXPECT_TRUE(j.at("record").is_null());
  EXPECT_EQ(j.at("error_message"), "No text could be extracted from the image");
}
