#pragma once

#include <deductly/app/config.hpp>
#include <deductly/app/receipt_scanner.hpp>
#include <deductly/text/text_recognizer.hpp>
#include <memory>

namespace deductly::app {

/// Recognizer selected by cfg.recognizer. The mock returns the contents of
/// cfg.mock_text_file (empty text when unset).
/// \throws std::runtime_error if the mock text file cannot be read, or the
///         Tesseract engine is unavailable or fails to initialise.
[[nodiscard]] std::unique_ptr<deductly::text::ITextRecognizer>
make_text_recognizer(const ScannerConfig& cfg);

[[nodiscard]] ScannerOptions make_scanner_options(const ScannerConfig& cfg);

/// Fresh scanner with its own recognizer (one per worker thread).
/// \throws std::runtime_error as make_text_recognizer.
[[nodiscard]] std::unique_ptr<ReceiptScanner> make_scanner(const ScannerConfig& cfg);

}  // namespace deductly::app
