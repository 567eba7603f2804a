#include "bitmap_cv_utils.hpp"
#include <deductly/core/bitmap.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace deductly::vision::detail {

namespace dc = deductly::core;

std::optional<cv::Mat> bitmap_to_mat(const dc::Bitmap& bitmap) {
  if (!bitmap.valid()) return std::nullopt;

  const int w = static_cast<int>(bitmap.width());
  const int h = static_cast<int>(bitmap.height());
  auto* data = const_cast<std::byte*>(bitmap.data().data());

  switch (bitmap.format()) {
    case dc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case dc::PixelFormat::RGB8:
    case dc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case dc::PixelFormat::RGBA8:
    case dc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data);
    case dc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

dc::Bitmap mat_to_bitmap(const cv::Mat& mat, dc::PixelFormat format) {
  if (mat.empty()) return dc::Bitmap();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return dc::Bitmap(w, h, format, std::move(buffer));
}

std::optional<cv::Mat> to_gray_mat(const dc::Bitmap& bitmap) {
  auto mat = bitmap_to_mat(bitmap);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (bitmap.format()) {
    case dc::PixelFormat::Grayscale8:
      gray = mat->clone();
      break;
    case dc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case dc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case dc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    case dc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case dc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

}  // namespace deductly::vision::detail
