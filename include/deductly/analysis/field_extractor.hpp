#pragma once

#include <deductly/analysis/ordered_rules.hpp>
#include <deductly/core/money.hpp>
#include <deductly/core/receipt.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deductly::analysis {

/// Vendor name used when no header line is usable.
inline constexpr std::string_view kUnknownVendor = "Unknown Vendor";

struct ExtractionOptions {
  int min_year{2015};
  int max_year{2035};
  /// Skip total/subtotal/tax/amount-due/balance lines when collecting items.
  bool exclude_summary_lines{true};
  bool deduplicate_items{false};
};

/// Everything FieldExtractor pulls from one receipt text.
struct ExtractedFields {
  std::string vendor_name{kUnknownVendor};
  deductly::core::Money total_amount{};
  std::optional<deductly::core::Money> tax_amount;
  std::optional<std::chrono::year_month_day> transaction_date;
  std::vector<deductly::core::LineItem> items;

  [[nodiscard]] bool has_vendor() const noexcept { return vendor_name != kUnknownVendor; }
  [[nodiscard]] bool has_amount() const noexcept { return total_amount.is_positive(); }
  [[nodiscard]] bool has_date() const noexcept { return transaction_date.has_value(); }
  [[nodiscard]] bool has_items() const noexcept { return !items.empty(); }
};

/// Heuristic field extraction from raw recognized receipt text.
/// Regex and rule tables are built once in the constructor; all extraction
/// methods are const and safe to call concurrently.
class FieldExtractor {
 public:
  explicit FieldExtractor(ExtractionOptions options = {});

  [[nodiscard]] ExtractedFields extract(std::string_view text) const;

  /// Known-vendor rules over the first five non-blank lines (most specific
  /// rule first), then the first plausible header line, else kUnknownVendor.
  [[nodiscard]] std::string extract_vendor(std::string_view text) const;

  /// Last match of the first labeled pattern that matches (TOTAL, AMOUNT DUE,
  /// BALANCE, GRAND TOTAL); else the largest currency token; else 0.00.
  [[nodiscard]] deductly::core::Money extract_total(std::string_view text) const;

  /// Same strategy over TAX, SALES TAX, TAX AMOUNT. nullopt when no tax line.
  [[nodiscard]] std::optional<deductly::core::Money> extract_tax(std::string_view text) const;

  /// First date that validates, trying M/D/Y (or D/M/Y), Y/M/D, "Mon D, Y",
  /// then "D-Mon-Y". For numeric forms the first component <= 12 is the month.
  [[nodiscard]] std::optional<std::chrono::year_month_day>
  extract_date(std::string_view text) const;

  [[nodiscard]] std::vector<deductly::core::LineItem> extract_items(std::string_view text) const;

  [[nodiscard]] const OrderedRules<std::string>& vendor_rules() const noexcept {
    return vendor_rules_;
  }
  [[nodiscard]] const ExtractionOptions& options() const noexcept { return options_; }

 private:
  [[nodiscard]] std::optional<std::chrono::year_month_day>
  make_date(int year, int month, int day) const;

  ExtractionOptions options_;
  OrderedRules<std::string> vendor_rules_;
};

/// "$1,234.56" -> 1234.56. Whitespace is ignored; nullopt if not an amount.
[[nodiscard]] std::optional<deductly::core::Money> parse_currency(std::string_view text);

/// Every currency-shaped token ("12.99", "$1,234.50") in text order.
[[nodiscard]] std::vector<deductly::core::Money> currency_tokens(std::string_view text);

/// True if text contains a numeric date-shaped token (03/15/2025, 2025-03-15).
[[nodiscard]] bool contains_date_token(std::string_view text);

/// Drops items whose description and price both equal an earlier item's.
[[nodiscard]] std::vector<deductly::core::LineItem>
deduplicate_items(std::vector<deductly::core::LineItem> items);

}  // namespace deductly::analysis
