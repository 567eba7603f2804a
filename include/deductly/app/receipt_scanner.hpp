#pragma once

#include <deductly/analysis/categorizer.hpp>
#include <deductly/analysis/confidence_scorer.hpp>
#include <deductly/analysis/field_extractor.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/receipt.hpp>
#include <deductly/text/text_recognizer.hpp>
#include <deductly/vision/image_preprocessor.hpp>
#include <deductly/vision/quality_assessor.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deductly::app {

/// Progress of one scan() call.
enum class ScanState {
  Start,
  Loaded,
  Preprocessed,
  Recognized,
  Extracted,
  Categorized,
  Scored,
  Done,
  Failed,
};

[[nodiscard]] std::string_view to_string(ScanState state) noexcept;

struct ScannerOptions {
  deductly::vision::PreprocessOptions preprocess;
  deductly::analysis::ExtractionOptions extraction;
  deductly::analysis::ConfidenceStrategyKind confidence_strategy{
      deductly::analysis::ConfidenceStrategyKind::HeuristicText};
  float quality_warning_threshold{0.3f};
};

/// Turns one receipt image into a ReceiptRecord:
/// load -> preprocess -> recognize -> extract -> categorize -> score.
///
/// scan() never throws and never retries; failures come back as a ScanResult
/// with success=false, an error code and a message, and no record.
/// An instance owns its recognizer and runs one scan at a time; use one
/// scanner per thread for parallel batches.
class ReceiptScanner {
 public:
  /// Called on every state transition (tests, tracing). The scanner keeps no
  /// per-scan state of its own; the observer is the only view of progress.
  using StateObserver = std::function<void(ScanState)>;

  /// \throws std::invalid_argument if recognizer is null.
  explicit ReceiptScanner(std::unique_ptr<deductly::text::ITextRecognizer> recognizer,
                          ScannerOptions options = {});

  [[nodiscard]] deductly::core::ScanResult scan(const deductly::core::ReceiptImage& image);

  [[nodiscard]] deductly::core::ScanResult scan(const std::filesystem::path& path) {
    return scan(deductly::core::ReceiptImage::from_path(path));
  }

  /// Load and preprocess only. ImageLoadError when the source is missing or undecodable.
  [[nodiscard]] std::expected<deductly::core::ProcessedImage, deductly::core::ScanError>
  preprocess(const deductly::core::ReceiptImage& image) const;

  /// Extract, categorize and score already-recognized text. extracted_at is now.
  [[nodiscard]] deductly::core::ReceiptRecord analyze_text(
      std::string raw_text, std::optional<float> reliability = std::nullopt) const;

  /// Pre-persistence check. Empty when the record is acceptable; never throws.
  [[nodiscard]] static std::vector<std::string> validate(
      const deductly::core::ReceiptRecord& record);

  void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

  [[nodiscard]] deductly::text::ITextRecognizer& recognizer() noexcept { return *recognizer_; }
  [[nodiscard]] const deductly::vision::ImagePreprocessor& preprocessor() const noexcept {
    return preprocessor_;
  }
  [[nodiscard]] const ScannerOptions& options() const noexcept { return options_; }

 private:
  struct LoadFailure {
    deductly::core::ScanError error;
    std::string message;
  };

  [[nodiscard]] std::expected<deductly::core::Bitmap, LoadFailure>
  load(const deductly::core::ReceiptImage& image) const;

  void run(const deductly::core::ReceiptImage& image, deductly::core::ScanResult& result);
  void fail(deductly::core::ScanResult& result,
            std::optional<deductly::core::ScanError> error,
            std::string message) const;
  void enter(ScanState state) const;

  std::unique_ptr<deductly::text::ITextRecognizer> recognizer_;
  ScannerOptions options_;
  deductly::vision::ImagePreprocessor preprocessor_;
  deductly::vision::QualityAssessor assessor_;
  deductly::analysis::FieldExtractor extractor_;
  deductly::analysis::Categorizer categorizer_;
  deductly::analysis::ConfidenceScorer scorer_;
  StateObserver observer_;
};

}  // namespace deductly::app
