#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>
#include <optional>

namespace deductly::vision {

/// Skew correction. The dominant rotation is taken from the minimum-area
/// rectangle around the largest contour of the Otsu-thresholded image and
/// normalized to (-45, 45] degrees. The bitmap is rotated only when the
/// magnitude exceeds threshold_degrees; otherwise it passes through unchanged.
/// Expects Grayscale8.
class DeskewStage : public deductly::core::IImageStage {
 public:
  explicit DeskewStage(double threshold_degrees = 5.0);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "deskew"; }

  /// Estimated skew in degrees (positive = content turned clockwise on screen),
  /// or nullopt when no contour is found.
  [[nodiscard]] static std::optional<double> estimate_angle(
      const deductly::core::Bitmap& gray);

  [[nodiscard]] double threshold_degrees() const noexcept { return threshold_degrees_; }

 private:
  double threshold_degrees_;
};

}  // namespace deductly::vision
