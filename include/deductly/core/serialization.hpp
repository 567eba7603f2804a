#pragma once

#include <deductly/core/receipt.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace deductly::core {

/// Flat JSON layout consumed by the persistence layer:
///   vendor_name, total_amount ("31.48"), tax_amount ("2.50" | null),
///   transaction_date ("2025-03-15" | null), items [{description, price}],
///   category ("medical"), confidence_score (0..1), raw_text,
///   extracted_at ("2025-03-15T10:04:05.123Z").
/// from_json throws nlohmann::json::exception (or std::invalid_argument for
/// malformed amounts, dates or categories); use deserialize_record for a
/// non-throwing parse.
void to_json(nlohmann::json& j, const LineItem& item);
void from_json(const nlohmann::json& j, LineItem& item);
void to_json(nlohmann::json& j, const ReceiptRecord& record);
void from_json(const nlohmann::json& j, ReceiptRecord& record);
void to_json(nlohmann::json& j, const ScanResult& result);

[[nodiscard]] std::string format_date(std::chrono::year_month_day date);
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_date(std::string_view text);
[[nodiscard]] std::string format_timestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

/// Compact JSON text for a record.
[[nodiscard]] std::string serialize_record(const ReceiptRecord& record);

/// Parse JSON text back into a record. Returns nullopt on any malformed field.
[[nodiscard]] std::optional<ReceiptRecord> deserialize_record(std::string_view text);

}  // namespace deductly::core
