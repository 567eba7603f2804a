#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>

namespace deductly::vision {

/// Morphological close then open with a square kernel: removes speckle
/// and reconnects thin strokes on a binarized bitmap.
class MorphologyStage : public deductly::core::IImageStage {
 public:
  explicit MorphologyStage(int kernel_size);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "morphology"; }

 private:
  int kernel_size_;
};

}  // namespace deductly::vision
