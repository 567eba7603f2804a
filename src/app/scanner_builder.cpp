#include <deductly/app/scanner_builder.hpp>
#include <deductly/text/mock_text_recognizer.hpp>
#ifdef DEDUCTLY_HAS_TESSERACT
#include <deductly/text/tesseract_text_recognizer.hpp>
#endif
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace deductly::app {

namespace {

std::string read_text_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("mock_text_file cannot be read: " + path);
  }
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

}  // namespace

std::unique_ptr<deductly::text::ITextRecognizer> make_text_recognizer(const ScannerConfig& cfg) {
  if (cfg.recognizer == RecognizerType::Tesseract) {
#ifdef DEDUCTLY_HAS_TESSERACT
    auto tesseract = std::make_unique<deductly::text::TesseractTextRecognizer>(cfg.tesseract);
    tesseract->warmup();
    return tesseract;
#else
    throw std::runtime_error(
        "recognizer=tesseract requires a build with -DDEDUCTLY_USE_TESSERACT=ON");
#endif
  }

  auto mock = std::make_unique<deductly::text::MockTextRecognizer>();
  if (!cfg.mock_text_file.empty()) {
    mock->set_text(read_text_file(cfg.mock_text_file));
  }
  return mock;
}

ScannerOptions make_scanner_options(const ScannerConfig& cfg) {
  ScannerOptions options;
  options.preprocess = cfg.preprocess;
  options.extraction = cfg.extraction;
  options.confidence_strategy = cfg.confidence_strategy;
  options.quality_warning_threshold = cfg.quality_warning_threshold;
  return options;
}

std::unique_ptr<ReceiptScanner> make_scanner(const ScannerConfig& cfg) {
  return std::make_unique<ReceiptScanner>(make_text_recognizer(cfg), make_scanner_options(cfg));
}

}  // namespace deductly::app
