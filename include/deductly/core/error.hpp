#pragma once

#include <string_view>

namespace deductly::core {

/// Scan error codes; used with std::expected for recoverable failures.
enum class ScanError {
  None = 0,
  ImageLoadError,         // source image missing, corrupt or unreadable (terminal)
  NoTextExtracted,        // recognition returned empty or whitespace-only text (terminal)
  PreprocessingDegraded,  // a preprocessing stage failed; a less-processed bitmap was used
  RecognitionFailed,      // the recognition capability itself failed (terminal)
  InvalidConfig,
};

[[nodiscard]] std::string_view to_string(ScanError error) noexcept;

}  // namespace deductly::core
