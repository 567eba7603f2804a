#include <deductly/vision/quality_assessor.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace deductly::vision {

namespace {

float clamp01(double v) {
  if (!std::isfinite(v)) return 0.f;
  return static_cast<float>(std::clamp(v, 0.0, 1.0));
}

}  // namespace

QualityReport QualityAssessor::assess(const deductly::core::Bitmap& bitmap) const {
  QualityReport report;
  try {
    auto gray = detail::to_gray_mat(bitmap);
    if (!gray) return report;

    cv::Mat laplacian;
    cv::Laplacian(*gray, laplacian, CV_64F);
    cv::Scalar lap_mean;
    cv::Scalar lap_stddev;
    cv::meanStdDev(laplacian, lap_mean, lap_stddev);
    const double laplacian_variance = lap_stddev[0] * lap_stddev[0];

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(*gray, mean, stddev);

    report.sharpness = clamp01(laplacian_variance / kSharpnessScale);
    report.contrast = clamp01(stddev[0] / kContrastScale);
    report.brightness = clamp01(1.0 - std::abs(mean[0] - kIdealBrightness) / kIdealBrightness);
    report.score = clamp01(kSharpnessWeight * report.sharpness +
                           kBrightnessWeight * report.brightness +
                           kContrastWeight * report.contrast);
  } catch (const cv::Exception& e) {
    deductly::core::log::logger()->warn("quality assessment failed: {}", e.what());
    return QualityReport{};
  }
  return report;
}

}  // namespace deductly::vision
