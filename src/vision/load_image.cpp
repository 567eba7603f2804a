#include <deductly/vision/load_image.hpp>
#include "bitmap_cv_utils.hpp"
#include <deductly/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace deductly::vision {

namespace dc = deductly::core;

namespace {

std::expected<dc::Bitmap, dc::ScanError> decoded_to_bitmap(const cv::Mat& mat) {
  if (mat.empty() || mat.depth() != CV_8U) {
    return std::unexpected(dc::ScanError::ImageLoadError);
  }
  switch (mat.channels()) {
    case 1:
      return detail::mat_to_bitmap(mat, dc::PixelFormat::Grayscale8);
    case 3:
      return detail::mat_to_bitmap(mat, dc::PixelFormat::BGR8);
    case 4:
      return detail::mat_to_bitmap(mat, dc::PixelFormat::BGRA8);
    default:
      return std::unexpected(dc::ScanError::ImageLoadError);
  }
}

}  // namespace

std::expected<dc::Bitmap, dc::ScanError> load_bitmap_from_file(const std::string& path) {
  cv::Mat mat;
  try {
    mat = cv::imread(path, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    dc::log::logger()->error("imread failed for {}: {}", path, e.what());
    return std::unexpected(dc::ScanError::ImageLoadError);
  }
  return decoded_to_bitmap(mat);
}

std::expected<dc::Bitmap, dc::ScanError> load_bitmap_from_bytes(
    std::span<const std::byte> encoded) {
  if (encoded.empty()) {
    return std::unexpected(dc::ScanError::ImageLoadError);
  }
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    dc::log::logger()->error("imdecode failed: {}", e.what());
    return std::unexpected(dc::ScanError::ImageLoadError);
  }
  return decoded_to_bitmap(mat);
}

bool save_bitmap(const dc::Bitmap& bitmap, const std::string& path) {
  auto mat = detail::bitmap_to_mat(bitmap);
  if (!mat) return false;

  try {
    cv::Mat out = *mat;
    if (bitmap.format() == dc::PixelFormat::RGB8) {
      cv::cvtColor(*mat, out, cv::COLOR_RGB2BGR);
    } else if (bitmap.format() == dc::PixelFormat::RGBA8) {
      cv::cvtColor(*mat, out, cv::COLOR_RGBA2BGRA);
    }
    return cv::imwrite(path, out);
  } catch (const cv::Exception& e) {
    dc::log::logger()->error("failed to save image {}: {}", path, e.what());
    return false;
  }
}

}  // namespace deductly::vision
