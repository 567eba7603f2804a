#include <deductly/core/money.hpp>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace deductly::core {

namespace {

constexpr std::int64_t kMaxWholeUnits = std::numeric_limits<std::int64_t>::max() / 1000;

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

}  // namespace

std::optional<Money> Money::parse(std::string_view text) {
  std::string_view s = trim(text);
  bool negative = false;
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (!s.empty() && s.front() == '$') {
    s.remove_prefix(1);
    s = trim(s);
  }
  if (s.empty()) return std::nullopt;

  std::int64_t whole = 0;
  std::size_t i = 0;
  std::size_t digits = 0;
  std::size_t group_len = 0;
  bool grouped = false;
  for (; i < s.size() && s[i] != '.'; ++i) {
    const char c = s[i];
    if (c == ',') {
      // Thousands separator: needs 1-3 leading digits, then groups of exactly 3.
      if (digits == 0 || (grouped && group_len != 3) || (!grouped && group_len > 3)) {
        return std::nullopt;
      }
      grouped = true;
      group_len = 0;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    if (whole > kMaxWholeUnits) return std::nullopt;
    whole = whole * 10 + (c - '0');
    ++digits;
    ++group_len;
  }
  if (grouped && group_len != 3) return std::nullopt;

  std::int64_t fraction = 0;
  bool round_up = false;
  if (i < s.size()) {
    ++i;  // '.'
    std::size_t frac_digits = 0;
    for (; i < s.size(); ++i) {
      const char c = s[i];
      if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
      if (frac_digits < 2) {
        fraction = fraction * 10 + (c - '0');
      } else if (frac_digits == 2) {
        round_up = c >= '5';
      }
      ++frac_digits;
      ++digits;
    }
    if (frac_digits == 1) fraction *= 10;
  }
  if (digits == 0) return std::nullopt;

  std::int64_t cents = whole * 100 + fraction + (round_up ? 1 : 0);
  return Money::from_cents(negative ? -cents : cents);
}

std::string Money::to_string() const {
  const bool negative = cents_ < 0;
  // Avoid overflow on the most negative value by working in unsigned.
  const std::uint64_t magnitude =
      negative ? static_cast<std::uint64_t>(-(cents_ + 1)) + 1u
               : static_cast<std::uint64_t>(cents_);
  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / 100);
  out += '.';
  const auto frac = magnitude % 100;
  if (frac < 10) out += '0';
  out += std::to_string(frac);
  return out;
}

}  // namespace deductly::core
