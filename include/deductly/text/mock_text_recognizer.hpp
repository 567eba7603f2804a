#pragma once

#include <deductly/text/text_recognizer.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace deductly::text {

/// Recognizer returning configurable canned text (tests, demos, offline runs).
class MockTextRecognizer : public ITextRecognizer {
 public:
  MockTextRecognizer() = default;
  explicit MockTextRecognizer(std::string text,
                              std::optional<float> reliability = std::nullopt);

  /// Text (and optional reliability) returned by subsequent recognize() calls.
  void set_text(std::string text, std::optional<float> reliability = std::nullopt);

  /// Make subsequent recognize() calls fail with RecognitionFailed.
  void set_failure(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<RecognizedText, deductly::core::ScanError>
  recognize(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::expected<void, deductly::core::ScanError>
  validate_input(const deductly::core::Bitmap& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  /// Number of recognize() calls so far.
  [[nodiscard]] std::size_t call_count() const noexcept { return calls_; }

 private:
  RecognizedText result_;
  bool fail_{false};
  std::size_t calls_{0};
};

}  // namespace deductly::text
