#include <deductly/core/pipeline.hpp>
#include <deductly/core/log.hpp>
#include <chrono>

namespace deductly::core {

void Pipeline::add_stage(std::unique_ptr<IImageStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

PipelineOutcome Pipeline::run(const Bitmap& input,
                              StageTimingCallback* timing_cb) const {
  PipelineOutcome outcome;
  Bitmap current = input;
  std::optional<Bitmap> baseline;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(current);
    const auto stage_end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
    if (timing_cb) {
      (*timing_cb)(i, ms);
    }
    log::logger()->debug("stage {} ({}) took {:.2f} ms", i, stages_[i]->name(), ms);

    if (!result) {
      log::logger()->warn("preprocessing stage '{}' failed ({}); falling back to {}",
                          stages_[i]->name(), to_string(result.error()),
                          baseline ? "baseline bitmap" : "unprocessed bitmap");
      outcome.bitmap = baseline ? std::move(*baseline) : input;
      outcome.degraded = true;
      outcome.failed_stage = i;
      return outcome;
    }

    current = std::move(*result);
    ++outcome.stages_completed;
    if (i == baseline_stage_) {
      baseline = current;
    }
  }

  outcome.bitmap = std::move(current);
  return outcome;
}

}  // namespace deductly::core
