#include <deductly/analysis/field_extractor.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <string>
#include <utility>

namespace deductly::analysis {

namespace {

using deductly::core::LineItem;
using deductly::core::Money;

constexpr std::size_t kVendorLineCount = 5;
constexpr std::size_t kMaxHeaderLength = 100;
// Longer lines are recognition noise. std::regex matches recursively, so every
// pattern below also uses bounded quantifiers.
constexpr std::size_t kMaxLineLength = 512;

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

// 1,234.56 | 31.48; never a rate ("8.25%") or a bare count ("3 ITEMS")
constexpr const char* kAmount = R"((\d{1,3}(?:,\d{3}){1,4}\.\d{2}|\d{1,12}\.\d{2})(?![\d.%]))";

// Optional rate between a label and its amount: "Tax 8.25% $0.83"
constexpr const char* kRate = R"((?:[:\s]{0,16}\d{1,3}(?:\.\d{1,4})?\s{0,2}%)?)";

struct VendorPattern {
  const char* name;
  const char* pattern;
  const char* display;
};

// Specific chains before the generic "pharmacy" / "fuel" fallbacks.
constexpr std::array<VendorPattern, 14> kVendorPatterns = {{
    {"walgreens", R"(walgreens)", "Walgreens"},
    {"cvs", R"(\bcvs\b)", "CVS"},
    {"walmart", R"(wal-?mart)", "Walmart"},
    {"costco", R"(costco)", "Costco"},
    {"target", R"(\btarget\b)", "Target"},
    {"amazon", R"(amazon)", "Amazon"},
    {"home_depot", R"(home\s{1,4}depot)", "Home Depot"},
    {"lowes", R"(\blowe'?s\b)", "Lowe's"},
    {"office_depot", R"(office\s{1,4}depot)", "Office Depot"},
    {"staples", R"(\bstaples\b)", "Staples"},
    {"chevron", R"(chevron|texaco)", "Chevron"},
    {"shell", R"(\bshell\b)", "Shell"},
    {"pharmacy", R"(pharmacy)", "Pharmacy"},
    {"gas_station", R"(\bfuel\b|gas\s{1,4}station)", "Gas Station"},
}};

std::regex labeled(const std::string& label) {
  return std::regex(R"(\b)" + label + kRate + R"([:\s]{0,16}\$?\s{0,4})" + kAmount, kIcase);
}

const std::vector<std::regex>& total_patterns() {
  static const std::vector<std::regex> patterns = {
      labeled("TOTAL"),
      labeled(R"(AMOUNT\s{1,4}DUE)"),
      labeled(R"(BALANCE(?:\s{1,4}DUE)?)"),
      labeled(R"(GRAND\s{1,4}TOTAL)"),
  };
  return patterns;
}

const std::vector<std::regex>& tax_patterns() {
  static const std::vector<std::regex> patterns = {
      labeled("TAX"),
      labeled(R"(SALES\s{1,4}TAX)"),
      labeled(R"(TAX\s{1,4}AMOUNT)"),
  };
  return patterns;
}

const std::regex& currency_pattern() {
  static const std::regex re(R"(\$?(?:\d{1,3}(?:,\d{3}){1,4}|\d{1,12})\.\d{2}(?!\d))");
  return re;
}

const std::regex& summary_line_pattern() {
  static const std::regex re(
      R"(\b(?:sub\s{0,2}-?\s{0,2}total|total|tax|amount\s{1,4}due|balance)\b)",
                             kIcase);
  return re;
}

const std::regex& total_word_pattern() {
  static const std::regex re(R"(^total\b)", kIcase);
  return re;
}

const std::regex& store_suffix_pattern() {
  static const std::regex re(
      R"(\s{0,8}(?:#\s{0,4}\d{1,8}|\b(?:store|str|no\.?)\s{0,4}#?\s{0,4}\d{1,8})\s{0,8}$)",
      kIcase);
  return re;
}

const std::regex& numeric_mdy_pattern() {
  static const std::regex re(R"((?:^|[^\d])(\d{1,2})[/-](\d{1,2})[/-](\d{2,4})(?!\d))");
  return re;
}

const std::regex& numeric_ymd_pattern() {
  static const std::regex re(R"((?:^|[^\d])(\d{4})[/-](\d{1,2})[/-](\d{1,2})(?!\d))");
  return re;
}

const std::regex& month_day_year_pattern() {
  static const std::regex re(
      R"(\b([A-Za-z]{3,9})\.?\s{1,4}(\d{1,2})(?:st|nd|rd|th)?,?\s{1,4}(\d{4}|\d{2})(?!\d))");
  return re;
}

const std::regex& day_month_year_pattern() {
  static const std::regex re(
      R"((?:^|[^\d])(\d{1,2})[-\s]([A-Za-z]{3,9})\.?[-\s,]{1,4}(\d{4}|\d{2})(?!\d))");
  return re;
}

const std::regex& date_token_pattern() {
  static const std::regex re(
      R"(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}|\d{4}[/-]\d{1,2}[/-]\d{1,2})");
  return re;
}

std::string_view trim(std::string_view s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(s.begin(), s.end(), not_space);
  auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (begin >= end) return {};
  return s.substr(static_cast<std::size_t>(begin - s.begin()),
                  static_cast<std::size_t>(end - begin));
}

std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

std::string without_long_lines(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (auto line : split_lines(text)) {
    if (line.size() > kMaxLineLength) continue;
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string title_case(std::string_view s) {
  std::string out = to_lower(s);
  bool word_start = true;
  for (auto& c : out) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      word_start = true;
    } else if (word_start) {
      c = static_cast<char>(std::toupper(uc));
      word_start = false;
    }
  }
  return out;
}

bool has_alpha(std::string_view s) {
  return std::any_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isalpha(c) != 0; });
}

bool starts_with_currency_symbol(std::string_view s) {
  return s.starts_with('$') || s.starts_with("\xE2\x82\xAC") /* euro */ ||
         s.starts_with("\xC2\xA3") /* pound */;
}

std::optional<std::string> header_vendor(std::string_view line) {
  if (line.size() > kMaxHeaderLength) return std::nullopt;
  if (starts_with_currency_symbol(line)) return std::nullopt;
  if (std::regex_search(line.begin(), line.end(), total_word_pattern())) return std::nullopt;
  if (!has_alpha(line)) return std::nullopt;
  const std::string stripped =
      std::regex_replace(std::string(line), store_suffix_pattern(), "");
  const auto name = trim(stripped);
  if (name.empty() || !has_alpha(name)) return std::nullopt;
  return title_case(name);
}

std::optional<int> month_from_name(std::string_view word) {
  static constexpr std::array<std::string_view, 12> kMonths = {
      "january", "february", "march",     "april",   "may",      "june",
      "july",    "august",   "september", "october", "november", "december"};
  const auto lower = to_lower(word);
  if (lower.size() < 3) return std::nullopt;
  if (lower == "sept") return 9;
  for (std::size_t i = 0; i < kMonths.size(); ++i) {
    if (kMonths[i].starts_with(lower)) return static_cast<int>(i) + 1;
  }
  return std::nullopt;
}

std::optional<Money> last_labeled_amount(std::string_view text,
                                         const std::vector<std::regex>& patterns) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  for (const auto& pattern : patterns) {
    std::optional<Money> found;
    for (std::cregex_iterator it(first, last, pattern), end; it != end; ++it) {
      if (auto amount = parse_currency((*it)[1].str())) found = amount;
    }
    if (found) return found;
  }
  return std::nullopt;
}

template <typename Fn>
void for_each_match(std::string_view text, const std::regex& re, Fn&& fn) {
  for (std::cregex_iterator it(text.data(), text.data() + text.size(), re), end; it != end;
       ++it) {
    if (fn(*it)) return;
  }
}

}  // namespace

FieldExtractor::FieldExtractor(ExtractionOptions options) : options_(options) {
  for (const auto& vendor : kVendorPatterns) {
    vendor_rules_.add(
        vendor.name,
        [re = std::regex(vendor.pattern, kIcase)](std::string_view line) {
          return std::regex_search(line.begin(), line.end(), re);
        },
        vendor.display);
  }
}

ExtractedFields FieldExtractor::extract(std::string_view text) const {
  ExtractedFields fields;
  fields.vendor_name = extract_vendor(text);
  fields.total_amount = extract_total(text);
  fields.tax_amount = extract_tax(text);
  fields.transaction_date = extract_date(text);
  fields.items = extract_items(text);
  return fields;
}

std::string FieldExtractor::extract_vendor(std::string_view text) const {
  std::vector<std::string_view> header;
  for (auto line : split_lines(text)) {
    line = trim(line);
    if (line.empty() || line.size() > kMaxLineLength) continue;
    header.push_back(line);
    if (header.size() == kVendorLineCount) break;
  }

  if (auto known = vendor_rules_.first_match_any(header)) {
    return *known;
  }
  for (auto line : header) {
    if (auto name = header_vendor(line)) return *name;
  }
  return std::string(kUnknownVendor);
}

Money FieldExtractor::extract_total(std::string_view text) const {
  const auto bounded = without_long_lines(text);
  if (auto labeled_total = last_labeled_amount(bounded, total_patterns())) {
    return *labeled_total;
  }
  const auto tokens = currency_tokens(bounded);
  if (tokens.empty()) return Money{};
  return *std::max_element(tokens.begin(), tokens.end());
}

std::optional<Money> FieldExtractor::extract_tax(std::string_view text) const {
  return last_labeled_amount(without_long_lines(text), tax_patterns());
}

std::optional<std::chrono::year_month_day>
FieldExtractor::make_date(int year, int month, int day) const {
  if (year < 100) year += 2000;
  if (year < options_.min_year || year > options_.max_year) return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
  const std::chrono::year_month_day date{std::chrono::year{year},
                                         std::chrono::month{static_cast<unsigned>(month)},
                                         std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

std::optional<std::chrono::year_month_day>
FieldExtractor::extract_date(std::string_view raw) const {
  const auto text = without_long_lines(raw);
  std::optional<std::chrono::year_month_day> result;

  for_each_match(text, numeric_mdy_pattern(), [&](const std::cmatch& m) {
    const int a = std::stoi(m[1].str());
    const int b = std::stoi(m[2].str());
    const int year = std::stoi(m[3].str());
    result = a <= 12 ? make_date(year, a, b) : make_date(year, b, a);
    return result.has_value();
  });
  if (result) return result;

  for_each_match(text, numeric_ymd_pattern(), [&](const std::cmatch& m) {
    const int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    if (month > 12 && day <= 12) std::swap(month, day);
    result = make_date(year, month, day);
    return result.has_value();
  });
  if (result) return result;

  for_each_match(text, month_day_year_pattern(), [&](const std::cmatch& m) {
    if (auto month = month_from_name(m[1].str())) {
      result = make_date(std::stoi(m[3].str()), *month, std::stoi(m[2].str()));
    }
    return result.has_value();
  });
  if (result) return result;

  for_each_match(text, day_month_year_pattern(), [&](const std::cmatch& m) {
    if (auto month = month_from_name(m[2].str())) {
      result = make_date(std::stoi(m[3].str()), *month, std::stoi(m[1].str()));
    }
    return result.has_value();
  });
  return result;
}

std::vector<LineItem> FieldExtractor::extract_items(std::string_view text) const {
  std::vector<LineItem> items;
  for (auto line : split_lines(text)) {
    line = trim(line);
    if (line.empty() || line.size() > kMaxLineLength) continue;

    std::optional<std::cmatch> last_token;
    for_each_match(line, currency_pattern(), [&](const std::cmatch& m) {
      last_token = m;
      return false;
    });
    if (!last_token) continue;
    if (options_.exclude_summary_lines &&
        std::regex_search(line.begin(), line.end(), summary_line_pattern())) {
      continue;
    }

    auto price = parse_currency(last_token->str());
    if (!price) continue;

    const auto pos = static_cast<std::size_t>(last_token->position(0));
    const auto len = static_cast<std::size_t>(last_token->length(0));
    std::string rest = std::string(line.substr(0, pos)) + std::string(line.substr(pos + len));

    auto description = trim(rest);
    while (!description.empty() &&
           std::string_view("-:@*").find(description.back()) != std::string_view::npos) {
      description.remove_suffix(1);
      description = trim(description);
    }
    if (description.empty()) continue;

    items.push_back(LineItem{std::string(description), *price});
  }
  if (options_.deduplicate_items) {
    items = deduplicate_items(std::move(items));
  }
  return items;
}

std::optional<Money> parse_currency(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.empty()) return std::nullopt;
  return Money::parse(compact);
}

std::vector<Money> currency_tokens(std::string_view text) {
  const auto bounded = without_long_lines(text);
  std::vector<Money> tokens;
  for_each_match(bounded, currency_pattern(), [&](const std::cmatch& m) {
    if (auto amount = parse_currency(m.str())) tokens.push_back(*amount);
    return false;
  });
  return tokens;
}

bool contains_date_token(std::string_view text) {
  const auto bounded = without_long_lines(text);
  return std::regex_search(bounded.begin(), bounded.end(), date_token_pattern());
}

std::vector<LineItem> deduplicate_items(std::vector<LineItem> items) {
  std::vector<LineItem> unique;
  unique.reserve(items.size());
  for (auto& item : items) {
    if (std::find(unique.begin(), unique.end(), item) == unique.end()) {
      unique.push_back(std::move(item));
    }
  }
  return unique;
}

}  // namespace deductly::analysis
