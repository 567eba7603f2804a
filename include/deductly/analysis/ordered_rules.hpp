#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace deductly::analysis {

/// Ordered list of (predicate, result) pairs evaluated short-circuit.
/// Earlier rules win: register the most specific rule first.
template <typename Result, typename Input = std::string_view>
class OrderedRules {
 public:
  using Predicate = std::function<bool(Input)>;

  struct Rule {
    std::string name;
    Predicate matches;
    Result result;
  };

  void add(std::string name, Predicate matches, Result result) {
    rules_.push_back(Rule{std::move(name), std::move(matches), std::move(result)});
  }

  /// Result of the first rule whose predicate accepts input.
  [[nodiscard]] std::optional<Result> first_match(Input input) const {
    for (const auto& rule : rules_) {
      if (rule.matches(input)) return rule.result;
    }
    return std::nullopt;
  }

  /// Rule-major search over several inputs: the first rule that accepts any
  /// input wins, regardless of which input it matched.
  template <typename Range>
  [[nodiscard]] std::optional<Result> first_match_any(const Range& inputs) const {
    for (const auto& rule : rules_) {
      for (const auto& input : inputs) {
        if (rule.matches(input)) return rule.result;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
  [[nodiscard]] const Rule& rule(std::size_t index) const { return rules_.at(index); }

 private:
  std::vector<Rule> rules_;
};

}  // namespace deductly::analysis
