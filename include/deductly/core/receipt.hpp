#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/category.hpp>
#include <deductly/core/error.hpp>
#include <deductly/core/money.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace deductly::core {

/// Timestamp type for extracted_at: UTC, millisecond precision.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// One purchased item parsed from a receipt line.
struct LineItem {
  std::string description;
  Money price{};

  bool operator==(const LineItem&) const = default;
};

/// Structured output of one successful scan. Immutable once returned by the scanner.
struct ReceiptRecord {
  std::string vendor_name;
  Money total_amount{};
  std::optional<Money> tax_amount;  // absent = no tax line printed (distinct from 0.00)
  std::optional<std::chrono::year_month_day> transaction_date;
  std::vector<LineItem> items;
  Category category{Category::Miscellaneous};
  float confidence_score{0.f};  // canonical [0, 1]
  std::string raw_text;
  Timestamp extracted_at{};

  bool operator==(const ReceiptRecord&) const = default;
};

/// Outcome of one scan() call. On failure, record is always absent.
struct ScanResult {
  bool success{false};
  std::optional<ReceiptRecord> record;
  std::optional<std::string> error_message;
  std::optional<ScanError> error;
  std::chrono::duration<double, std::milli> processing_time{0};
  float image_quality_score{0.f};  // processed image, [0, 1]
  float raw_quality_score{0.f};    // raw image before preprocessing, [0, 1]
  bool degraded{false};            // preprocessing fell back to a less-processed bitmap
};

/// Reference to the source image: a file path or a non-owning view of encoded bytes.
/// Not owned or persisted beyond the scan call.
class ReceiptImage {
 public:
  struct EncodedBytes {
    std::span<const std::byte> bytes;
    std::string name;
  };

  [[nodiscard]] static ReceiptImage from_path(std::filesystem::path path) {
    return ReceiptImage(std::move(path));
  }
  [[nodiscard]] static ReceiptImage from_bytes(std::span<const std::byte> bytes,
                                               std::string name = "uploaded_image") {
    return ReceiptImage(EncodedBytes{bytes, std::move(name)});
  }

  [[nodiscard]] bool is_path() const noexcept {
    return std::holds_alternative<std::filesystem::path>(source_);
  }
  [[nodiscard]] const std::filesystem::path* path() const noexcept {
    return std::get_if<std::filesystem::path>(&source_);
  }
  [[nodiscard]] const EncodedBytes* encoded() const noexcept {
    return std::get_if<EncodedBytes>(&source_);
  }

  /// Path string or the display name of an in-memory image (for messages and logs).
  [[nodiscard]] std::string describe() const;

 private:
  explicit ReceiptImage(std::variant<std::filesystem::path, EncodedBytes> source)
      : source_(std::move(source)) {}

  std::variant<std::filesystem::path, EncodedBytes> source_;
};

/// Preprocessed bitmap plus its quality. Lives only for the duration of one scan.
struct ProcessedImage {
  Bitmap bitmap;
  float quality_score{0.f};
  bool degraded{false};
  std::optional<std::size_t> failed_stage;  // index of the stage that failed, if any
};

}  // namespace deductly::core
