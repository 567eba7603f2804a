#pragma once

#include <deductly/core/bitmap.hpp>

namespace deductly::vision {

/// Per-signal breakdown of an image quality assessment. All values in [0, 1].
struct QualityReport {
  float sharpness{0.f};   // Laplacian variance / kSharpnessScale, capped at 1
  float contrast{0.f};    // intensity stddev / kContrastScale, capped at 1
  float brightness{0.f};  // 1 - |mean - 128| / 128
  float score{0.f};       // 0.4 sharpness + 0.3 brightness + 0.3 contrast, clamped
};

/// Predicts text-recognition reliability from sharpness, contrast and brightness.
/// Works on any supported pixel format (color input is converted to gray first).
/// Stateless; safe to share across threads.
class QualityAssessor {
 public:
  static constexpr double kSharpnessScale = 500.0;
  static constexpr double kContrastScale = 64.0;
  static constexpr double kIdealBrightness = 128.0;

  static constexpr float kSharpnessWeight = 0.4f;
  static constexpr float kBrightnessWeight = 0.3f;
  static constexpr float kContrastWeight = 0.3f;

  /// Full breakdown. An empty or invalid bitmap scores zero on every signal.
  [[nodiscard]] QualityReport assess(const deductly::core::Bitmap& bitmap) const;

  /// Combined score only.
  [[nodiscard]] float score(const deductly::core::Bitmap& bitmap) const {
    return assess(bitmap).score;
  }
};

}  // namespace deductly::vision
