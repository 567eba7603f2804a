#include <deductly/vision/morphology_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace deductly::vision {

MorphologyStage::MorphologyStage(int kernel_size)
    : kernel_size_(kernel_size < 1 ? 1 : kernel_size) {}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
MorphologyStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    const cv::Mat kernel =
        cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernel_size_, kernel_size_));
    cv::Mat closed;
    cv::morphologyEx(*mat_in, closed, cv::MORPH_CLOSE, kernel);
    cv::Mat mat_out;
    cv::morphologyEx(closed, mat_out, cv::MORPH_OPEN, kernel);
    return detail::mat_to_bitmap(mat_out, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("morphology failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
