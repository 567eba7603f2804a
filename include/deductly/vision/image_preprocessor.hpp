#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/pipeline.hpp>
#include <deductly/core/receipt.hpp>
#include <deductly/vision/quality_assessor.hpp>
#include <cstdint>

namespace deductly::vision {

/// Tunables for the preprocessing chain. Grayscale conversion always runs first.
struct PreprocessOptions {
  bool enable_crop{false};
  std::uint32_t resize_target_height{0};  // 0 = no resize

  bool enable_denoise{true};
  int bilateral_diameter{9};
  double bilateral_sigma{75.0};
  int median_kernel{3};

  bool enable_contrast{true};
  double clahe_clip_limit{2.0};
  int clahe_tile_grid{8};

  bool enable_deskew{true};
  double deskew_threshold_degrees{5.0};

  bool enable_binarize{true};
  int adaptive_block_size{11};
  double adaptive_c{2.0};

  bool enable_morphology{false};
  int morphology_kernel{2};
};

/// Normalizes a decoded receipt bitmap for text recognition:
/// grayscale -> [crop] -> [resize] -> denoise -> contrast -> deskew -> binarize -> [morphology].
///
/// Never fails on a valid bitmap: when a stage fails internally the result falls
/// back to the grayscale bitmap (or the input if grayscale itself failed) and
/// ProcessedImage::degraded is set.
class ImagePreprocessor {
 public:
  explicit ImagePreprocessor(PreprocessOptions options = {});

  [[nodiscard]] deductly::core::ProcessedImage preprocess(
      const deductly::core::Bitmap& raw,
      deductly::core::StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const deductly::core::Pipeline& pipeline() const noexcept { return pipeline_; }
  [[nodiscard]] const PreprocessOptions& options() const noexcept { return options_; }

 private:
  PreprocessOptions options_;
  deductly::core::Pipeline pipeline_;
  QualityAssessor assessor_;
};

}  // namespace deductly::vision
