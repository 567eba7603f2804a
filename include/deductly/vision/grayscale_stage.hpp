#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>

namespace deductly::vision {

/// Converts any supported pixel format to Grayscale8. Grayscale input is copied.
class GrayscaleStage : public deductly::core::IImageStage {
 public:
  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "grayscale"; }
};

}  // namespace deductly::vision
