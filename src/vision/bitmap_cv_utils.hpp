#pragma once

#include <deductly/core/bitmap.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace deductly::vision::detail {

/// Wrap a Bitmap as a cv::Mat header (no copy; valid while the Bitmap lives).
/// Returns nullopt if the format is unknown or the buffer is too small.
std::optional<cv::Mat> bitmap_to_mat(const deductly::core::Bitmap& bitmap);

/// Copy a cv::Mat (CV_8UC1/3/4) into a Bitmap with the given format.
deductly::core::Bitmap mat_to_bitmap(const cv::Mat& mat,
                                     deductly::core::PixelFormat format);

/// Single-channel 8-bit copy of the input (BGR/RGB/BGRA/RGBA converted).
std::optional<cv::Mat> to_gray_mat(const deductly::core::Bitmap& bitmap);

}  // namespace deductly::vision::detail
