#include <deductly/core/serialization.hpp>
#include <charconv>
#include <cstdio>
#include <stdexcept>

namespace deductly::core {

namespace {

bool read_int(std::string_view text, std::size_t pos, std::size_t len, int& out) {
  if (pos + len > text.size()) return false;
  const char* first = text.data() + pos;
  const char* last = first + len;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

Money money_from_json(const nlohmann::json& j) {
  auto parsed = Money::parse(j.get<std::string>());
  if (!parsed) {
    throw std::invalid_argument("malformed amount: " + j.get<std::string>());
  }
  return *parsed;
}

}  // namespace

std::string format_date(std::chrono::year_month_day date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
  return buf;
}

std::optional<std::chrono::year_month_day> parse_date(std::string_view text) {
  int y = 0;
  int m = 0;
  int d = 0;
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
  if (!read_int(text, 0, 4, y) || !read_int(text, 5, 2, m) || !read_int(text, 8, 2, d)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{y},
                                        std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  return ymd;
}

std::string format_timestamp(Timestamp ts) {
  const auto day_point = std::chrono::floor<std::chrono::days>(ts);
  const std::chrono::year_month_day ymd{day_point};
  const std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{ts - day_point};
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%sT%02d:%02d:%02d.%03dZ", format_date(ymd).c_str(),
                static_cast<int>(tod.hours().count()),
                static_cast<int>(tod.minutes().count()),
                static_cast<int>(tod.seconds().count()),
                static_cast<int>(tod.subseconds().count()));
  return buf;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
  // YYYY-MM-DDTHH:MM:SS.mmmZ
  if (text.size() != 24 || text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
      text[19] != '.' || text[23] != 'Z') {
    return std::nullopt;
  }
  const auto date = parse_date(text.substr(0, 10));
  int hh = 0;
  int mm = 0;
  int ss = 0;
  int ms = 0;
  if (!date || !read_int(text, 11, 2, hh) || !read_int(text, 14, 2, mm) ||
      !read_int(text, 17, 2, ss) || !read_int(text, 20, 3, ms)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;
  return std::chrono::sys_days{*date} + std::chrono::hours{hh} + std::chrono::minutes{mm} +
         std::chrono::seconds{ss} + std::chrono::milliseconds{ms};
}

void to_json(nlohmann::json& j, const LineItem& item) {
  j = nlohmann::json{{"description", item.description}, {"price", item.price.to_string()}};
}

void from_json(const nlohmann::json& j, LineItem& item) {
  item.description = j.at("description").get<std::string>();
  item.price = money_from_json(j.at("price"));
}

void to_json(nlohmann::json& j, const ReceiptRecord& record) {
  j = nlohmann::json{
      {"vendor_name", record.vendor_name},
      {"total_amount", record.total_amount.to_string()},
      {"tax_amount", record.tax_amount ? nlohmann::json(record.tax_amount->to_string())
                                       : nlohmann::json(nullptr)},
      {"transaction_date", record.transaction_date
                               ? nlohmann::json(format_date(*record.transaction_date))
                               : nlohmann::json(nullptr)},
      {"items", record.items},
      {"category", std::string(to_string(record.category))},
      {"confidence_score", record.confidence_score},
      {"raw_text", record.raw_text},
      {"extracted_at", format_timestamp(record.extracted_at)},
  };
}

void from_json(const nlohmann::json& j, ReceiptRecord& record) {
  record.vendor_name = j.at("vendor_name").get<std::string>();
  record.total_amount = money_from_json(j.at("total_amount"));

  const auto& tax = j.at("tax_amount");
  record.tax_amount = tax.is_null() ? std::nullopt : std::optional<Money>(money_from_json(tax));

  const auto& date = j.at("transaction_date");
  if (date.is_null()) {
    record.transaction_date.reset();
  } else {
    record.transaction_date = parse_date(date.get<std::string>());
    if (!record.transaction_date) {
      throw std::invalid_argument("malformed transaction_date: " + date.get<std::string>());
    }
  }

  record.items = j.at("items").get<std::vector<LineItem>>();

  const auto category_name = j.at("category").get<std::string>();
  const auto category = parse_category(category_name);
  if (!category) {
    throw std::invalid_argument("unknown category: " + category_name);
  }
  record.category = *category;

  record.confidence_score = j.at("confidence_score").get<float>();
  record.raw_text = j.at("raw_text").get<std::string>();

  const auto extracted_at = parse_timestamp(j.at("extracted_at").get<std::string>());
  if (!extracted_at) {
    throw std::invalid_argument("malformed extracted_at");
  }
  record.extracted_at = *extracted_at;
}

void to_json(nlohmann::json& j, const ScanResult& result) {
  j = nlohmann::json{
      {"success", result.success},
      {"record", result.record ? nlohmann::json(*result.record) : nlohmann::json(nullptr)},
      {"error_message", result.error_message ? nlohmann::json(*result.error_message)
                                             : nlohmann::json(nullptr)},
      {"error", result.error ? nlohmann::json(std::string(to_string(*result.error)))
                             : nlohmann::json(nullptr)},
      {"processing_time_ms", result.processing_time.count()},
      {"image_quality_score", result.image_quality_score},
      {"raw_quality_score", result.raw_quality_score},
      {"degraded", result.degraded},
  };
}

std::string serialize_record(const ReceiptRecord& record) {
  // Recognized text is not guaranteed to be UTF-8.
  return nlohmann::json(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<ReceiptRecord> deserialize_record(std::string_view text) {
  const auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
  try {
    return parsed.get<ReceiptRecord>();
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

}  // namespace deductly::core
