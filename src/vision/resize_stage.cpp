#include <deductly/vision/resize_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace deductly::vision {

ResizeStage::ResizeStage(std::uint32_t target_height)
    : target_height_(target_height) {}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
ResizeStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in || target_height_ == 0) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  if (input.height() == target_height_) {
    return input;
  }

  try {
    const double aspect = static_cast<double>(input.width()) / input.height();
    const int new_width =
        std::max(1, static_cast<int>(std::lround(aspect * target_height_)));
    cv::Mat mat_out;
    cv::resize(*mat_in, mat_out, cv::Size(new_width, static_cast<int>(target_height_)), 0, 0,
               cv::INTER_CUBIC);
    return detail::mat_to_bitmap(mat_out, input.format());
  } catch (const cv::Exception& e) {
    log::logger()->warn("resize failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
