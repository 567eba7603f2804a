#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/pipeline_stage.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace deductly::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Result of running the stage chain. Never fails outright: when a stage fails,
/// bitmap is the least-processed available fallback and degraded is set.
struct PipelineOutcome {
  Bitmap bitmap;
  bool degraded{false};
  std::optional<std::size_t> failed_stage;
  std::size_t stages_completed{0};
};

/// Runs a sequence of image stages in order, passing each output to the next.
///
/// Degradation: if stage i fails, the run stops and returns the output of the
/// baseline stage (index 0 by default, e.g. grayscale) when that stage has
/// completed, or the untouched input otherwise.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IImageStage> stage);

  /// Index of the stage whose output is the fallback bitmap.
  void set_baseline_stage(std::size_t index) noexcept { baseline_stage_ = index; }
  [[nodiscard]] std::size_t baseline_stage() const noexcept { return baseline_stage_; }

  /// Run all stages on one bitmap.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe as long as the stages are (the built-in stages hold only parameters).
  [[nodiscard]] PipelineOutcome run(const Bitmap& input,
                                    StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }
  [[nodiscard]] const IImageStage& stage(std::size_t index) const {
    return *stages_.at(index);
  }

 private:
  std::vector<std::unique_ptr<IImageStage>> stages_;
  std::size_t baseline_stage_{0};
};

}  // namespace deductly::core
