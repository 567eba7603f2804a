#pragma once

#include <deductly/analysis/field_extractor.hpp>
#include <deductly/core/money.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace deductly::analysis {

/// Everything either strategy may look at. Views must outlive the score() call.
struct ConfidenceInputs {
  bool has_vendor{false};
  bool has_amount{false};
  bool has_date{false};
  bool has_items{false};
  /// Recognition reliability in [0, 1] reported by the engine, if any.
  std::optional<float> reliability;

  std::string_view raw_text;
  deductly::core::Money total_amount{};
  std::string_view vendor_name;

  [[nodiscard]] static ConfidenceInputs from(const ExtractedFields& fields,
                                             std::string_view raw_text,
                                             std::optional<float> reliability = std::nullopt);
};

/// Confidence strategy. Every implementation returns a value in [0, 1].
class IConfidenceStrategy {
 public:
  virtual ~IConfidenceStrategy() = default;

  [[nodiscard]] virtual float score(const ConfidenceInputs& inputs) const = 0;
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// 25 points per found field (vendor, amount, date, items), scaled by the
/// clamped recognition reliability when present, divided by 100.
class PresenceFlagsStrategy : public IConfidenceStrategy {
 public:
  [[nodiscard]] float score(const ConfidenceInputs& inputs) const override;
  [[nodiscard]] std::string_view name() const noexcept override { return "presence"; }
};

/// Text-length bands (+30/+20/+10), +25 positive amount, +20 known vendor,
/// +15 date-shaped token, +10 for more than three distinct currency tokens.
/// Capped at 100, divided by 100.
class HeuristicTextStrategy : public IConfidenceStrategy {
 public:
  [[nodiscard]] float score(const ConfidenceInputs& inputs) const override;
  [[nodiscard]] std::string_view name() const noexcept override { return "heuristic"; }
};

enum class ConfidenceStrategyKind {
  HeuristicText,
  PresenceFlags,
};

/// "heuristic" / "presence" (case-insensitive).
[[nodiscard]] std::optional<ConfidenceStrategyKind> parse_strategy_kind(std::string_view name);

[[nodiscard]] std::unique_ptr<IConfidenceStrategy> make_strategy(ConfidenceStrategyKind kind);

/// Scores with the selected strategy. Both historical call shapes stay
/// available as score_presence / score_heuristic and share the [0, 1] scale.
class ConfidenceScorer {
 public:
  explicit ConfidenceScorer(ConfidenceStrategyKind kind = ConfidenceStrategyKind::HeuristicText);

  [[nodiscard]] float score(const ConfidenceInputs& inputs) const {
    return strategy_->score(inputs);
  }

  [[nodiscard]] ConfidenceStrategyKind kind() const noexcept { return kind_; }
  [[nodiscard]] const IConfidenceStrategy& strategy() const noexcept { return *strategy_; }

  [[nodiscard]] static float score_presence(bool has_vendor,
                                            bool has_amount,
                                            bool has_date,
                                            bool has_items,
                                            std::optional<float> reliability = std::nullopt);

  [[nodiscard]] static float score_heuristic(std::string_view raw_text,
                                             deductly::core::Money total_amount,
                                             std::string_view vendor_name);

 private:
  ConfidenceStrategyKind kind_;
  std::unique_ptr<IConfidenceStrategy> strategy_;
};

}  // namespace deductly::analysis
