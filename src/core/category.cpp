#include <deductly/core/category.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace deductly::core {

std::string_view to_string(Category category) noexcept {
  switch (category) {
    case Category::Medical:
      return "medical";
    case Category::Charitable:
      return "charitable";
    case Category::Business:
      return "business";
    case Category::Education:
      return "education";
    case Category::Vehicle:
      return "vehicle";
    case Category::HomeOffice:
      return "home_office";
    case Category::Retirement:
      return "retirement";
    case Category::Energy:
      return "energy";
    case Category::StateLocal:
      return "state_local";
    case Category::Miscellaneous:
      return "miscellaneous";
  }
  return "";
}

std::optional<Category> parse_category(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const Category c : kAllCategories) {
    if (to_string(c) == lowered) return c;
  }
  return std::nullopt;
}

}  // namespace deductly::core
