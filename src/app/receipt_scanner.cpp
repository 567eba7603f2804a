#include <deductly/app/receipt_scanner.hpp>
#include <deductly/core/log.hpp>
#include <deductly/vision/load_image.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace deductly::app {

namespace dc = deductly::core;
namespace da = deductly::analysis;

namespace {

constexpr std::string_view kNoTextMessage = "No text could be extracted from the image";

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

dc::Timestamp now_ms() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

dc::ReceiptRecord build_record(da::ExtractedFields fields,
                               dc::Category category,
                               float confidence,
                               std::string raw_text) {
  dc::ReceiptRecord record;
  record.vendor_name = std::move(fields.vendor_name);
  record.total_amount = fields.total_amount;
  record.tax_amount = fields.tax_amount;
  record.transaction_date = fields.transaction_date;
  record.items = std::move(fields.items);
  record.category = category;
  record.confidence_score = confidence;
  record.raw_text = std::move(raw_text);
  record.extracted_at = now_ms();
  return record;
}

}  // namespace

std::string_view to_string(ScanState state) noexcept {
  switch (state) {
    case ScanState::Start: return "start";
    case ScanState::Loaded: return "loaded";
    case ScanState::Preprocessed: return "preprocessed";
    case ScanState::Recognized: return "recognized";
    case ScanState::Extracted: return "extracted";
    case ScanState::Categorized: return "categorized";
    case ScanState::Scored: return "scored";
    case ScanState::Done: return "done";
    case ScanState::Failed: return "failed";
  }
  return "unknown";
}

ReceiptScanner::ReceiptScanner(std::unique_ptr<deductly::text::ITextRecognizer> recognizer,
                               ScannerOptions options)
    : recognizer_(std::move(recognizer)),
      options_(std::move(options)),
      preprocessor_(options_.preprocess),
      extractor_(options_.extraction),
      scorer_(options_.confidence_strategy) {
  if (!recognizer_) {
    throw std::invalid_argument("ReceiptScanner: text recognizer must not be null");
  }
}

void ReceiptScanner::enter(ScanState state) const {
  if (observer_) observer_(state);
}

void ReceiptScanner::fail(dc::ScanResult& result,
                          std::optional<dc::ScanError> error,
                          std::string message) const {
  result.success = false;
  result.record.reset();
  result.error = error;
  result.error_message = std::move(message);
  dc::log::logger()->error("scan failed: {}", *result.error_message);
  enter(ScanState::Failed);
}

std::expected<dc::Bitmap, ReceiptScanner::LoadFailure>
ReceiptScanner::load(const dc::ReceiptImage& image) const {
  if (const auto* path = image.path()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec)) {
      return std::unexpected(
          LoadFailure{dc::ScanError::ImageLoadError, "Image file not found: " + path->string()});
    }
    auto loaded = deductly::vision::load_bitmap_from_file(path->string());
    if (!loaded) {
      return std::unexpected(
          LoadFailure{loaded.error(), "Could not load image: " + path->string()});
    }
    return std::move(*loaded);
  }

  const auto* encoded = image.encoded();
  auto loaded = deductly::vision::load_bitmap_from_bytes(encoded->bytes);
  if (!loaded) {
    return std::unexpected(LoadFailure{loaded.error(), "Could not load image: " + encoded->name});
  }
  return std::move(*loaded);
}

std::expected<dc::ProcessedImage, dc::ScanError>
ReceiptScanner::preprocess(const dc::ReceiptImage& image) const {
  auto bitmap = load(image);
  if (!bitmap) {
    return std::unexpected(bitmap.error().error);
  }
  return preprocessor_.preprocess(*bitmap);
}

dc::ScanResult ReceiptScanner::scan(const dc::ReceiptImage& image) {
  const auto start = std::chrono::steady_clock::now();
  dc::ScanResult result;
  try {
    run(image, result);
  } catch (const std::exception& e) {
    fail(result, std::nullopt, std::string("Scanning failed: ") + e.what());
  }
  result.processing_time = std::chrono::steady_clock::now() - start;

  if (result.success) {
    const auto& r = *result.record;
    dc::log::logger()->info(
        "scanned {}: vendor='{}' total={} category={} confidence={:.2f} ({:.1f} ms)",
        image.describe(), r.vendor_name, r.total_amount.to_string(),
        dc::to_string(r.category), r.confidence_score, result.processing_time.count());
  }
  return result;
}

void ReceiptScanner::run(const dc::ReceiptImage& image, dc::ScanResult& result) {
  enter(ScanState::Start);

  auto bitmap = load(image);
  if (!bitmap) {
    fail(result, bitmap.error().error, std::move(bitmap.error().message));
    return;
  }
  enter(ScanState::Loaded);

  result.raw_quality_score = assessor_.score(*bitmap);
  if (result.raw_quality_score < options_.quality_warning_threshold) {
    dc::log::logger()->warn("low image quality for {} ({:.2f}); recognition may be unreliable",
                            image.describe(), result.raw_quality_score);
  }

  auto processed = preprocessor_.preprocess(*bitmap);
  result.image_quality_score = processed.quality_score;
  result.degraded = processed.degraded;
  enter(ScanState::Preprocessed);

  auto recognized = recognizer_->recognize(processed.bitmap);
  if (!recognized) {
    fail(result, recognized.error(),
         "Text recognition failed: " + std::string(dc::to_string(recognized.error())));
    return;
  }
  if (is_blank(recognized->text)) {
    fail(result, dc::ScanError::NoTextExtracted, std::string(kNoTextMessage));
    return;
  }
  enter(ScanState::Recognized);

  auto text = std::move(recognized->text);
  auto fields = extractor_.extract(text);
  enter(ScanState::Extracted);

  const auto category = categorizer_.categorize(fields.vendor_name, text);
  enter(ScanState::Categorized);

  const float confidence =
      scorer_.score(da::ConfidenceInputs::from(fields, text, recognized->reliability));
  enter(ScanState::Scored);

  result.record = build_record(std::move(fields), category, confidence, std::move(text));
  result.success = true;
  enter(ScanState::Done);
}

dc::ReceiptRecord ReceiptScanner::analyze_text(std::string raw_text,
                                               std::optional<float> reliability) const {
  auto fields = extractor_.extract(raw_text);
  const auto category = categorizer_.categorize(fields.vendor_name, raw_text);
  const float confidence =
      scorer_.score(da::ConfidenceInputs::from(fields, raw_text, reliability));
  return build_record(std::move(fields), category, confidence, std::move(raw_text));
}

std::vector<std::string> ReceiptScanner::validate(const dc::ReceiptRecord& record) {
  std::vector<std::string> problems;
  if (is_blank(record.vendor_name)) {
    problems.emplace_back("Vendor name is required");
  }
  if (!record.total_amount.is_positive()) {
    problems.emplace_back("Total amount must be greater than zero");
  }
  if (record.tax_amount && record.tax_amount->is_negative()) {
    problems.emplace_back("Tax amount cannot be negative");
  }
  if (!dc::is_known_category(record.category)) {
    problems.emplace_back("Category is not a recognized deduction category");
  }
  if (!std::isfinite(record.confidence_score) || record.confidence_score < 0.f ||
      record.confidence_score > 1.f) {
    problems.emplace_back("Confidence score must be between 0 and 1");
  }
  for (const auto& item : record.items) {
    if (item.price.is_negative()) {
      problems.push_back("Item '" + item.description + "' cannot have a negative price");
    }
  }
  return problems;
}

}  // namespace deductly::app
