#include <deductly/vision/grayscale_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>

namespace deductly::vision {

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
GrayscaleStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  try {
    auto gray = detail::to_gray_mat(input);
    if (!gray) {
      return std::unexpected(ScanError::PreprocessingDegraded);
    }
    return detail::mat_to_bitmap(*gray, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("grayscale conversion failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
