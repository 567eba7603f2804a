#pragma once

#include <deductly/analysis/confidence_scorer.hpp>
#include <deductly/analysis/field_extractor.hpp>
#include <deductly/core/error.hpp>
#include <deductly/text/tesseract_text_recognizer.hpp>
#include <deductly/vision/image_preprocessor.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace deductly::app {

/// Text recognition engine: mock (canned text) or tesseract.
enum class RecognizerType {
  Mock,
  Tesseract,
};

/// "mock" / "tesseract" (case-insensitive).
[[nodiscard]] std::optional<RecognizerType> parse_recognizer_type(std::string_view name);

/// Scanner configuration: recognizer, preprocessing, extraction and scoring.
struct ScannerConfig {
  RecognizerType recognizer{RecognizerType::Mock};
  std::string mock_text_file;
  deductly::text::TesseractOptions tesseract;

  deductly::analysis::ConfidenceStrategyKind confidence_strategy{
      deductly::analysis::ConfidenceStrategyKind::HeuristicText};
  deductly::vision::PreprocessOptions preprocess;
  deductly::analysis::ExtractionOptions extraction;

  /// Raw images scoring below this log a quality warning.
  float quality_warning_threshold{0.3f};
  std::string log_level{"info"};
};

/// Default config when no file is provided.
ScannerConfig default_config();

/// Load config from a key=value file (one per line, '#' comments).
/// Unknown keys are ignored; malformed values keep their defaults (logged).
/// InvalidConfig if the file cannot be opened.
[[nodiscard]] std::expected<ScannerConfig, deductly::core::ScanError>
load_config(const std::string& path);

}  // namespace deductly::app
