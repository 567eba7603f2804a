#include <deductly/core/bitmap.hpp>
#include <cstddef>

namespace deductly::core {

bool Bitmap::valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) {
    return false;
  }
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

Bitmap Bitmap::filled(std::uint32_t width,
                      std::uint32_t height,
                      std::uint8_t value) {
  std::vector<std::byte> buffer(min_bytes(width, height, PixelFormat::Grayscale8),
                                static_cast<std::byte>(value));
  return Bitmap(width, height, PixelFormat::Grayscale8, std::move(buffer));
}

std::uint32_t Bitmap::channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Bitmap::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channel_count(format);
}

}  // namespace deductly::core
