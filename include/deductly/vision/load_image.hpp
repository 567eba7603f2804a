#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace deductly::vision {

/// Load an image file into a Bitmap (BGR8 or Grayscale8).
/// Fails with ImageLoadError if the file is missing or cannot be decoded.
[[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
load_bitmap_from_file(const std::string& path);

/// Decode an in-memory encoded image (PNG, JPEG, ...). ImageLoadError on failure.
[[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
load_bitmap_from_bytes(std::span<const std::byte> encoded);

/// Write a bitmap to disk; the extension selects the codec. Returns false on failure.
bool save_bitmap(const deductly::core::Bitmap& bitmap, const std::string& path);

}  // namespace deductly::vision
