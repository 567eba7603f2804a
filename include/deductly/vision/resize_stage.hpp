#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace deductly::vision {

/// Scales a bitmap to a target height, keeping the aspect ratio (cubic).
/// Bitmaps already at the target height are copied unchanged.
class ResizeStage : public deductly::core::IImageStage {
 public:
  explicit ResizeStage(std::uint32_t target_height);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "resize"; }

 private:
  std::uint32_t target_height_;
};

}  // namespace deductly::vision
