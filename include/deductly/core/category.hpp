#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace deductly::core {

/// Tax-deduction bucket for a receipt. Closed set; Miscellaneous is the default.
/// Declaration order is the categorizer's tie-break order.
enum class Category : std::uint8_t {
  Medical,
  Charitable,
  Business,
  Education,
  Vehicle,
  HomeOffice,
  Retirement,
  Energy,
  StateLocal,
  Miscellaneous,
};

inline constexpr std::array<Category, 10> kAllCategories = {
    Category::Medical,    Category::Charitable, Category::Business,
    Category::Education,  Category::Vehicle,    Category::HomeOffice,
    Category::Retirement, Category::Energy,     Category::StateLocal,
    Category::Miscellaneous,
};

/// Canonical name ("medical", "home_office", ...); "" for out-of-range values.
[[nodiscard]] std::string_view to_string(Category category) noexcept;

/// Inverse of to_string (case-insensitive). nullopt for unknown names.
[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

/// True if the value is one of the declared enumerators.
[[nodiscard]] constexpr bool is_known_category(Category category) noexcept {
  return static_cast<std::uint8_t>(category) <=
         static_cast<std::uint8_t>(Category::Miscellaneous);
}

}  // namespace deductly::core
