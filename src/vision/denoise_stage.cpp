#include <deductly/vision/denoise_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace deductly::vision {

DenoiseStage::DenoiseStage(int bilateral_diameter, double bilateral_sigma, int median_kernel)
    : bilateral_diameter_(bilateral_diameter),
      bilateral_sigma_(bilateral_sigma),
      // medianBlur needs an odd aperture > 1
      median_kernel_(median_kernel < 3 ? 3 : (median_kernel | 1)) {}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
DenoiseStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    cv::Mat smoothed;
    cv::bilateralFilter(*mat_in, smoothed, bilateral_diameter_, bilateral_sigma_,
                        bilateral_sigma_);
    cv::Mat mat_out;
    cv::medianBlur(smoothed, mat_out, median_kernel_);
    return detail::mat_to_bitmap(mat_out, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("denoise failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
