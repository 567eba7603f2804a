#include <deductly/vision/contrast_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace deductly::vision {

ContrastStage::ContrastStage(double clip_limit, int tile_grid)
    : clip_limit_(clip_limit), tile_grid_(tile_grid < 1 ? 1 : tile_grid) {}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
ContrastStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    // cv::CLAHE holds state; one instance per call.
    cv::Ptr<cv::CLAHE> clahe =
        cv::createCLAHE(clip_limit_, cv::Size(tile_grid_, tile_grid_));
    cv::Mat mat_out;
    clahe->apply(*mat_in, mat_out);
    return detail::mat_to_bitmap(mat_out, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("contrast enhancement failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
