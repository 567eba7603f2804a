#pragma once

#include <deductly/text/text_recognizer.hpp>
#include <memory>
#include <string>

namespace deductly::text {

/// Tesseract settings. Defaults: LSTM engine, single uniform block of text,
/// character whitelist limited to what receipts print.
struct TesseractOptions {
  std::string data_path;  // empty = Tesseract's compiled-in default / TESSDATA_PREFIX
  std::string language{"eng"};
  int page_seg_mode{6};
  std::string char_whitelist{"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz.,$/- "};
};

/// Tesseract-backed recognizer. Available when built with DEDUCTLY_HAS_TESSERACT.
///
/// Input contract: Grayscale8, RGB8 or RGBA8 bitmap (BGR layouts are accepted as
/// well; channel order does not matter to the engine for text).
/// reliability is Tesseract's mean word confidence divided by 100.
class TesseractTextRecognizer : public ITextRecognizer {
 public:
  /// \throws std::runtime_error if the engine cannot be initialised
  ///         (missing language data, bad data path).
  explicit TesseractTextRecognizer(TesseractOptions options = {});

  ~TesseractTextRecognizer() override;

  TesseractTextRecognizer(const TesseractTextRecognizer&) = delete;
  TesseractTextRecognizer& operator=(const TesseractTextRecognizer&) = delete;

  [[nodiscard]] std::expected<RecognizedText, deductly::core::ScanError>
  recognize(const deductly::core::Bitmap& input) override;

  [[nodiscard]] std::expected<void, deductly::core::ScanError>
  validate_input(const deductly::core::Bitmap& input) const override;

  void warmup() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "tesseract"; }

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace deductly::text
