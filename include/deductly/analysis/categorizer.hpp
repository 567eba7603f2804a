#pragma once

#include <deductly/core/category.hpp>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace deductly::analysis {

/// Keyword count per category, indexed like core::kAllCategories.
using CategoryScores = std::array<std::size_t, deductly::core::kAllCategories.size()>;

/// Keyword-count categorizer. The keyword table is fixed at construction and
/// read-only afterwards.
class Categorizer {
 public:
  struct Entry {
    deductly::core::Category category;
    std::vector<std::string> keywords;  // lowercase
  };

  Categorizer();

  /// Highest-scoring category with a non-zero score; ties go to the category
  /// declared first. Miscellaneous when nothing scores.
  [[nodiscard]] deductly::core::Category categorize(std::string_view vendor_name,
                                                    std::string_view raw_text) const;

  /// Case-insensitive keyword occurrence counts over vendor + " " + text.
  [[nodiscard]] CategoryScores scores(std::string_view vendor_name,
                                      std::string_view raw_text) const;

  [[nodiscard]] const std::vector<Entry>& table() const noexcept { return table_; }

 private:
  std::vector<Entry> table_;
};

}  // namespace deductly::analysis
