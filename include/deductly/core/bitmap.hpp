#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace deductly::core {

/// Memory: Bitmap owns a single contiguous buffer (std::vector<std::byte>);
/// rows are tightly packed. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Bitmap instances are independent; sharing one
/// Bitmap across threads requires external synchronization.

/// 8-bit pixel layout.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Decoded receipt image or an intermediate preprocessing result.
class Bitmap {
 public:
  Bitmap() = default;

  Bitmap(std::uint32_t width,
         std::uint32_t height,
         PixelFormat format,
         std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept {
    return channel_count(format_);
  }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Buffer holds at least min_bytes() for its dimensions and a known format.
  [[nodiscard]] bool valid() const noexcept;

  /// Uniform grayscale bitmap (tests, placeholders).
  [[nodiscard]] static Bitmap filled(std::uint32_t width,
                                     std::uint32_t height,
                                     std::uint8_t value);

  [[nodiscard]] static std::uint32_t channel_count(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace deductly::core
