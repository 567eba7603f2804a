#include <deductly/vision/image_preprocessor.hpp>
#include <deductly/vision/binarize_stage.hpp>
#include <deductly/vision/contrast_stage.hpp>
#include <deductly/vision/crop_stage.hpp>
#include <deductly/vision/denoise_stage.hpp>
#include <deductly/vision/deskew_stage.hpp>
#include <deductly/vision/grayscale_stage.hpp>
#include <deductly/vision/morphology_stage.hpp>
#include <deductly/vision/resize_stage.hpp>
#include <memory>

namespace deductly::vision {

ImagePreprocessor::ImagePreprocessor(PreprocessOptions options)
    : options_(std::move(options)) {
  pipeline_.add_stage(std::make_unique<GrayscaleStage>());
  pipeline_.set_baseline_stage(0);

  if (options_.enable_crop) {
    pipeline_.add_stage(std::make_unique<CropStage>());
  }
  if (options_.resize_target_height > 0) {
    pipeline_.add_stage(std::make_unique<ResizeStage>(options_.resize_target_height));
  }
  if (options_.enable_denoise) {
    pipeline_.add_stage(std::make_unique<DenoiseStage>(
        options_.bilateral_diameter, options_.bilateral_sigma, options_.median_kernel));
  }
  if (options_.enable_contrast) {
    pipeline_.add_stage(std::make_unique<ContrastStage>(options_.clahe_clip_limit,
                                                        options_.clahe_tile_grid));
  }
  if (options_.enable_deskew) {
    pipeline_.add_stage(std::make_unique<DeskewStage>(options_.deskew_threshold_degrees));
  }
  if (options_.enable_binarize) {
    pipeline_.add_stage(std::make_unique<BinarizeStage>(options_.adaptive_block_size,
                                                        options_.adaptive_c));
  }
  if (options_.enable_morphology) {
    pipeline_.add_stage(std::make_unique<MorphologyStage>(options_.morphology_kernel));
  }
}

deductly::core::ProcessedImage ImagePreprocessor::preprocess(
    const deductly::core::Bitmap& raw,
    deductly::core::StageTimingCallback* timing_cb) const {
  auto outcome = pipeline_.run(raw, timing_cb);

  deductly::core::ProcessedImage processed;
  processed.quality_score = assessor_.score(outcome.bitmap);
  processed.bitmap = std::move(outcome.bitmap);
  processed.degraded = outcome.degraded;
  processed.failed_stage = outcome.failed_stage;
  return processed;
}

}  // namespace deductly::vision
