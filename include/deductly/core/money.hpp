#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deductly::core {

/// Fixed-point currency amount with two fractional digits, stored as cents.
class Money {
 public:
  constexpr Money() = default;

  [[nodiscard]] static constexpr Money from_cents(std::int64_t cents) noexcept {
    Money m;
    m.cents_ = cents;
    return m;
  }

  /// Parses "12.99", "$1,234.56", "-3.5", " 7 ". A leading '$' and thousands
  /// separators are accepted; digits past the second decimal round half-up.
  /// Returns nullopt for anything that is not a plain decimal amount.
  [[nodiscard]] static std::optional<Money> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t cents() const noexcept { return cents_; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return cents_ == 0; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return cents_ > 0; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return cents_ < 0; }

  /// Canonical decimal string: "31.48", "0.00", "-2.50".
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] constexpr Money operator+(Money other) const noexcept {
    return from_cents(cents_ + other.cents_);
  }
  [[nodiscard]] constexpr Money operator-(Money other) const noexcept {
    return from_cents(cents_ - other.cents_);
  }
  constexpr Money& operator+=(Money other) noexcept {
    cents_ += other.cents_;
    return *this;
  }

  constexpr auto operator<=>(const Money&) const = default;

 private:
  std::int64_t cents_{0};
};

}  // namespace deductly::core
