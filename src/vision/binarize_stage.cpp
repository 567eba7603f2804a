#include <deductly/vision/binarize_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace deductly::vision {

BinarizeStage::BinarizeStage(int block_size, double c)
    // adaptiveThreshold needs an odd block size > 1
    : block_size_(block_size < 3 ? 3 : (block_size | 1)), c_(c) {}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
BinarizeStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    cv::Mat blurred;
    cv::GaussianBlur(*mat_in, blurred, cv::Size(5, 5), 0);
    cv::Mat mat_out;
    cv::adaptiveThreshold(blurred, mat_out, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                          cv::THRESH_BINARY, block_size_, c_);
    return detail::mat_to_bitmap(mat_out, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("binarization failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
