#include <deductly/analysis/categorizer.hpp>
#include <algorithm>
#include <cctype>

namespace deductly::analysis {

namespace {

using deductly::core::Category;

std::size_t count_occurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return 0;
  std::size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

Categorizer::Categorizer()
    : table_{
          {Category::Medical,
           {"pharmacy", "doctor", "hospital", "clinic", "medical", "dental", "prescription",
            "rx", "medicine", "walgreens", "cvs", "aspirin"}},
          {Category::Charitable,
           {"donation", "charity", "church", "temple", "mosque", "nonprofit", "contribution"}},
          {Category::Business,
           {"office", "supplies", "equipment", "software", "computer", "printer", "business"}},
          {Category::Education,
           {"bookstore", "university", "college", "school", "tuition", "textbook",
            "education"}},
          {Category::Vehicle,
           {"gas", "gasoline", "fuel", "auto", "car", "truck", "vehicle", "repair", "oil"}},
          {Category::HomeOffice,
           {"home depot", "lowes", "office depot", "staples", "furniture", "desk", "chair"}},
          {Category::Retirement, {"ira", "401k", "retirement", "pension", "annuity"}},
          {Category::Energy, {"electric", "gas bill", "utility", "solar", "energy"}},
          {Category::StateLocal, {"property tax", "county", "state", "local", "license"}},
      } {}

CategoryScores Categorizer::scores(std::string_view vendor_name,
                                   std::string_view raw_text) const {
  std::string combined;
  combined.reserve(vendor_name.size() + 1 + raw_text.size());
  combined.append(vendor_name).append(" ").append(raw_text);
  std::transform(combined.begin(), combined.end(), combined.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  CategoryScores result{};
  for (const auto& entry : table_) {
    std::size_t score = 0;
    for (const auto& keyword : entry.keywords) {
      score += count_occurrences(combined, keyword);
    }
    result[static_cast<std::size_t>(entry.category)] = score;
  }
  return result;
}

Category Categorizer::categorize(std::string_view vendor_name,
                                 std::string_view raw_text) const {
  const auto s = scores(vendor_name, raw_text);
  Category best = Category::Miscellaneous;
  std::size_t best_score = 0;
  for (auto category : deductly::core::kAllCategories) {
    const auto score = s[static_cast<std::size_t>(category)];
    if (score > best_score) {
      best = category;
      best_score = score;
    }
  }
  return best;
}

}  // namespace deductly::analysis
