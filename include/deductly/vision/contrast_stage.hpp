#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <expected>

namespace deductly::vision {

/// Tile-based contrast-limited adaptive histogram equalization (CLAHE),
/// evening out lighting across a single receipt. Expects Grayscale8.
class ContrastStage : public deductly::core::IImageStage {
 public:
  ContrastStage(double clip_limit, int tile_grid);

  [[nodiscard]] std::expected<deductly::core::Bitmap, deductly::core::ScanError>
  process(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "contrast"; }

 private:
  double clip_limit_;
  int tile_grid_;
};

}  // namespace deductly::vision
