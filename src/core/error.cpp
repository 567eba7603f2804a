#include <deductly/core/error.hpp>

namespace deductly::core {

std::string_view to_string(ScanError error) noexcept {
  switch (error) {
    case ScanError::None:
      return "None";
    case ScanError::ImageLoadError:
      return "ImageLoadError";
    case ScanError::NoTextExtracted:
      return "NoTextExtracted";
    case ScanError::PreprocessingDegraded:
      return "PreprocessingDegraded";
    case ScanError::RecognitionFailed:
      return "RecognitionFailed";
    case ScanError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace deductly::core
