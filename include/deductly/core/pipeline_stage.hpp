#pragma once

#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <expected>
#include <string_view>

namespace deductly::core {

/// Abstract preprocessing stage: one pure transform Bitmap -> Bitmap.
/// A stage reports an internal failure as PreprocessingDegraded instead of throwing.
class IImageStage {
 public:
  virtual ~IImageStage() = default;

  [[nodiscard]] virtual std::expected<Bitmap, ScanError> process(
      const Bitmap& input) = 0;

  /// Short name for logs and timing output ("grayscale", "deskew", ...).
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace deductly::core
