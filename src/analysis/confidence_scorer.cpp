#include <deductly/analysis/confidence_scorer.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <string>

namespace deductly::analysis {

namespace {

constexpr int kPointsPerField = 25;
constexpr int kMaxPoints = 100;
constexpr std::size_t kDetailedTokenCount = 3;

float reliability_factor(std::optional<float> reliability) {
  if (!reliability || !std::isfinite(*reliability)) return 1.f;
  return std::clamp(*reliability, 0.f, 1.f);
}

}  // namespace

ConfidenceInputs ConfidenceInputs::from(const ExtractedFields& fields,
                                        std::string_view raw_text,
                                        std::optional<float> reliability) {
  ConfidenceInputs in;
  in.has_vendor = fields.has_vendor();
  in.has_amount = fields.has_amount();
  in.has_date = fields.has_date();
  in.has_items = fields.has_items();
  in.reliability = reliability;
  in.raw_text = raw_text;
  in.total_amount = fields.total_amount;
  in.vendor_name = fields.vendor_name;
  return in;
}

float PresenceFlagsStrategy::score(const ConfidenceInputs& inputs) const {
  int points = 0;
  if (inputs.has_vendor) points += kPointsPerField;
  if (inputs.has_amount) points += kPointsPerField;
  if (inputs.has_date) points += kPointsPerField;
  if (inputs.has_items) points += kPointsPerField;
  const float scaled = static_cast<float>(points) * reliability_factor(inputs.reliability);
  return std::clamp(scaled / static_cast<float>(kMaxPoints), 0.f, 1.f);
}

float HeuristicTextStrategy::score(const ConfidenceInputs& inputs) const {
  int points = 0;

  const auto length = inputs.raw_text.size();
  if (length > 100) {
    points += 30;
  } else if (length > 50) {
    points += 20;
  } else if (length > 20) {
    points += 10;
  }

  if (inputs.total_amount.is_positive()) points += 25;
  if (!inputs.vendor_name.empty() && inputs.vendor_name != kUnknownVendor) points += 20;
  if (contains_date_token(inputs.raw_text)) points += 15;

  const auto tokens = currency_tokens(inputs.raw_text);
  const std::set<deductly::core::Money> distinct(tokens.begin(), tokens.end());
  if (distinct.size() > kDetailedTokenCount) points += 10;

  points = std::min(points, kMaxPoints);
  return static_cast<float>(points) / static_cast<float>(kMaxPoints);
}

std::optional<ConfidenceStrategyKind> parse_strategy_kind(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "heuristic") return ConfidenceStrategyKind::HeuristicText;
  if (lower == "presence") return ConfidenceStrategyKind::PresenceFlags;
  return std::nullopt;
}

std::unique_ptr<IConfidenceStrategy> make_strategy(ConfidenceStrategyKind kind) {
  switch (kind) {
    case ConfidenceStrategyKind::PresenceFlags:
      return std::make_unique<PresenceFlagsStrategy>();
    case ConfidenceStrategyKind::HeuristicText:
      break;
  }
  return std::make_unique<HeuristicTextStrategy>();
}

ConfidenceScorer::ConfidenceScorer(ConfidenceStrategyKind kind)
    : kind_(kind), strategy_(make_strategy(kind)) {}

float ConfidenceScorer::score_presence(bool has_vendor,
                                       bool has_amount,
                                       bool has_date,
                                       bool has_items,
                                       std::optional<float> reliability) {
  ConfidenceInputs in;
  in.has_vendor = has_vendor;
  in.has_amount = has_amount;
  in.has_date = has_date;
  in.has_items = has_items;
  in.reliability = reliability;
  return PresenceFlagsStrategy{}.score(in);
}

float ConfidenceScorer::score_heuristic(std::string_view raw_text,
                                        deductly::core::Money total_amount,
                                        std::string_view vendor_name) {
  ConfidenceInputs in;
  in.raw_text = raw_text;
  in.total_amount = total_amount;
  in.vendor_name = vendor_name;
  return HeuristicTextStrategy{}.score(in);
}

}  // namespace deductly::analysis
