#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>

namespace deductly::vision {

/// Edge-preserving bilateral smoothing followed by a light median filter.
/// Expects Grayscale8.
class DenoiseStage : public deductly::core::IImageStage {
 public:
  DenoiseStage(int bilateral_diameter, double bilateral_sigma, int median_kernel);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "denoise"; }

 private:
  int bilateral_diameter_;
  double bilateral_sigma_;
  int median_kernel_;
};

}  // namespace deductly::vision
