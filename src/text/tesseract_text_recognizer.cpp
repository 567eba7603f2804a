#include <deductly/text/tesseract_text_recognizer.hpp>
#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/log.hpp>
#include <tesseract/baseapi.h>
#include <leptonica/allheaders.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace deductly::text {

namespace {

/// Owns the char* returned by GetUTF8Text.
struct TessText {
  char* ptr{nullptr};
  ~TessText() { delete[] ptr; }
};

}  // namespace

struct TesseractTextRecognizer::Impl {
  tesseract::TessBaseAPI api;
  TesseractOptions options;

  ~Impl() { api.End(); }
};

TesseractTextRecognizer::TesseractTextRecognizer(TesseractOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
  const char* data_path =
      impl_->options.data_path.empty() ? nullptr : impl_->options.data_path.c_str();
  if (impl_->api.Init(data_path, impl_->options.language.c_str(),
                      tesseract::OEM_LSTM_ONLY) != 0) {
    throw std::runtime_error("TesseractTextRecognizer: could not initialise language '" +
                             impl_->options.language + "'");
  }
  impl_->api.SetPageSegMode(
      static_cast<tesseract::PageSegMode>(impl_->options.page_seg_mode));
  if (!impl_->options.char_whitelist.empty()) {
    impl_->api.SetVariable("tessedit_char_whitelist",
                           impl_->options.char_whitelist.c_str());
  }
  deductly::core::log::logger()->debug("tesseract {} initialised (lang={}, psm={})",
                                       tesseract::TessBaseAPI::Version(),
                                       impl_->options.language,
                                       impl_->options.page_seg_mode);
}

TesseractTextRecognizer::~TesseractTextRecognizer() = default;

std::expected<void, deductly::core::ScanError>
TesseractTextRecognizer::validate_input(const deductly::core::Bitmap& input) const {
  if (input.empty() || !input.valid()) {
    return std::unexpected(deductly::core::ScanError::RecognitionFailed);
  }
  const auto ch = input.channels();
  if (ch != 1 && ch != 3 && ch != 4) {
    return std::unexpected(deductly::core::ScanError::RecognitionFailed);
  }
  return {};
}

std::expected<RecognizedText, deductly::core::ScanError>
TesseractTextRecognizer::recognize(const deductly::core::Bitmap& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const auto channels = static_cast<int>(input.channels());
  const auto width = static_cast<int>(input.width());
  const auto height = static_cast<int>(input.height());
  impl_->api.SetImage(reinterpret_cast<const unsigned char*>(input.data().data()),
                      width, height, channels, width * channels);

  TessText raw{impl_->api.GetUTF8Text()};
  if (raw.ptr == nullptr) {
    impl_->api.Clear();
    return std::unexpected(deductly::core::ScanError::RecognitionFailed);
  }

  RecognizedText out;
  out.text = raw.ptr;
  const int mean_conf = impl_->api.MeanTextConf();
  if (mean_conf >= 0) {
    out.reliability = std::clamp(static_cast<float>(mean_conf) / 100.f, 0.f, 1.f);
  }
  impl_->api.Clear();
  return out;
}

void TesseractTextRecognizer::warmup() {
  auto blank = deductly::core::Bitmap::filled(64, 32, 255);
  auto result = recognize(blank);
  if (!result) {
    deductly::core::log::logger()->warn("tesseract warmup failed");
  }
}

}  // namespace deductly::text
