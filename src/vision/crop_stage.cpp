#include <deductly/vision/crop_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace deductly::vision {

namespace {

constexpr double kMinAspect = 1.2;
constexpr double kMaxAspect = 5.0;

}  // namespace

CropStage::CropStage(double min_area, std::uint32_t padding)
    : min_area_(min_area), padding_(padding) {}

std::optional<Region> CropStage::detect_region(const deductly::core::Bitmap& input) const {
  try {
    auto gray = detail::to_gray_mat(input);
    if (!gray) return std::nullopt;

    cv::Mat edges;
    cv::Canny(*gray, edges, 50, 150);
    // Close one-pixel gaps so the page outline forms a single contour.
    cv::dilate(edges, edges, cv::Mat());
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::optional<Region> best;
    double best_area = 0.0;
    for (const auto& contour : contours) {
      const double area = cv::contourArea(contour);
      if (area < min_area_ || area <= best_area) continue;
      const cv::Rect box = cv::boundingRect(contour);
      if (box.width <= 0) continue;
      const double aspect = static_cast<double>(box.height) / box.width;
      if (aspect <= kMinAspect || aspect >= kMaxAspect) continue;
      best_area = area;
      best = Region{static_cast<std::uint32_t>(box.x), static_cast<std::uint32_t>(box.y),
                    static_cast<std::uint32_t>(box.width),
                    static_cast<std::uint32_t>(box.height)};
    }
    return best;
  } catch (const cv::Exception& e) {
    deductly::core::log::logger()->warn("receipt region detection failed: {}", e.what());
    return std::nullopt;
  }
}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
CropStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    const auto region = detect_region(input);
    if (!region) {
      return input;
    }
    const std::uint32_t x = region->x > padding_ ? region->x - padding_ : 0;
    const std::uint32_t y = region->y > padding_ ? region->y - padding_ : 0;
    const std::uint32_t w = std::min(input.width() - x, region->width + 2 * padding_);
    const std::uint32_t h = std::min(input.height() - y, region->height + 2 * padding_);
    const cv::Mat cropped = (*mat_in)(cv::Rect(static_cast<int>(x), static_cast<int>(y),
                                               static_cast<int>(w), static_cast<int>(h)));
    return detail::mat_to_bitmap(cropped, input.format());
  } catch (const cv::Exception& e) {
    log::logger()->warn("receipt crop failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
