#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>
#include <optional>

namespace deductly::vision {

/// Pixel rectangle inside a bitmap.
struct Region {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Crops to the receipt paper when it can be found: Canny edges, external
/// contours of at least min_area pixels whose height/width ratio lies in
/// (1.2, 5.0); the largest wins and is padded by `padding` pixels.
/// When nothing qualifies the bitmap passes through unchanged.
class CropStage : public deductly::core::IImageStage {
 public:
  explicit CropStage(double min_area = 10000.0, std::uint32_t padding = 10);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "crop"; }

  /// Bounding box of the receipt region (unpadded), if one qualifies.
  [[nodiscard]] std::optional<Region> detect_region(
      const deductly::core::Bitmap& input) const;

 private:
  double min_area_;
  std::uint32_t padding_;
};

}  // namespace deductly::vision
