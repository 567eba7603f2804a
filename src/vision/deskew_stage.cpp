#include <deductly/vision/deskew_stage.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <vector>

namespace deductly::vision {

namespace {

std::optional<double> estimate_angle_mat(const cv::Mat& gray) {
  cv::Mat mask;
  cv::threshold(gray, mask, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) return std::nullopt;

  std::size_t largest = 0;
  double largest_area = 0.0;
  for (std::size_t i = 0; i < contours.size(); ++i) {
    const double area = cv::contourArea(contours[i]);
    if (area > largest_area) {
      largest_area = area;
      largest = i;
    }
  }
  if (largest_area <= 0.0) return std::nullopt;

  // The reported RotatedRect::angle convention changed across OpenCV releases,
  // so measure the near-horizontal box edge instead.
  cv::Point2f corners[4];
  cv::minAreaRect(contours[largest]).points(corners);
  const cv::Point2f e1 = corners[1] - corners[0];
  const cv::Point2f e2 = corners[2] - corners[1];
  const cv::Point2f edge = std::abs(e1.x) >= std::abs(e1.y) ? e1 : e2;
  double angle = std::atan2(edge.y, edge.x) * 180.0 / CV_PI;
  while (angle > 45.0) angle -= 90.0;
  while (angle <= -45.0) angle += 90.0;
  return angle;
}

}  // namespace

DeskewStage::DeskewStage(double threshold_degrees)
    : threshold_degrees_(threshold_degrees) {}

std::optional<double> DeskewStage::estimate_angle(const deductly::core::Bitmap& gray) {
  if (gray.format() != deductly::core::PixelFormat::Grayscale8) return std::nullopt;
  auto mat = detail::bitmap_to_mat(gray);
  if (!mat) return std::nullopt;
  try {
    return estimate_angle_mat(*mat);
  } catch (const cv::Exception& e) {
    deductly::core::log::logger()->warn("skew estimation failed: {}", e.what());
    return std::nullopt;
  }
}

std::expected<deductly::core::Bitmap, deductly::core::ScanError>
DeskewStage::process(const deductly::core::Bitmap& input) {
  using namespace deductly::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
  auto mat_in = detail::bitmap_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ScanError::PreprocessingDegraded);
  }

  try {
    const auto angle = estimate_angle_mat(*mat_in);
    if (!angle || std::abs(*angle) <= threshold_degrees_) {
      return input;
    }

    log::logger()->debug("deskew: rotating by {:.2f} degrees", *angle);
    const cv::Point2f center(static_cast<float>(mat_in->cols) / 2.f,
                             static_cast<float>(mat_in->rows) / 2.f);
    const cv::Mat rotation = cv::getRotationMatrix2D(center, *angle, 1.0);
    cv::Mat mat_out;
    cv::warpAffine(*mat_in, mat_out, rotation, mat_in->size(), cv::INTER_CUBIC,
                   cv::BORDER_REPLICATE);
    return detail::mat_to_bitmap(mat_out, PixelFormat::Grayscale8);
  } catch (const cv::Exception& e) {
    log::logger()->warn("skew correction failed: {}", e.what());
    return std::unexpected(ScanError::PreprocessingDegraded);
  }
}

}  // namespace deductly::vision
