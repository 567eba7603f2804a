#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace deductly::text {

/// Output of one recognition call.
struct RecognizedText {
  std::string text;
  /// Engine-reported reliability in [0, 1], when the engine provides one.
  std::optional<float> reliability;
};

/// Abstract text-recognition engine: preprocessed Bitmap -> raw text.
/// Implement recognize(); optionally override validate_input and warmup.
///
/// An instance is used by one scan at a time. Batch runners create one
/// recognizer per worker.
class ITextRecognizer {
 public:
  virtual ~ITextRecognizer() = default;

  /// Recognize the text in one bitmap. An empty string is a valid result
  /// (the caller decides whether that is an error).
  [[nodiscard]] virtual std::expected<RecognizedText, deductly::core::ScanError>
  recognize(const deductly::core::Bitmap& input) = 0;

  /// Optional: validate format/dimensions before recognize. Default: accept.
  [[nodiscard]] virtual std::expected<void, deductly::core::ScanError>
  validate_input(const deductly::core::Bitmap& /*input*/) const {
    return {};
  }

  /// Optional: one-off engine initialisation run. Default: no-op.
  virtual void warmup() {}

  /// Short engine name for logs ("mock", "tesseract").
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace deductly::text
