#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>

namespace deductly::vision {

/// Local (adaptive Gaussian) thresholding after a 5x5 Gaussian blur.
/// Output pixels are 0 (ink) or 255 (background). Expects Grayscale8.
class BinarizeStage : public deductly::core::IImageStage {
 public:
  BinarizeStage(int block_size, double c);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "binarize"; }

 private:
  int block_size_;
  double c_;
};

}  // namespace deductly::vision
