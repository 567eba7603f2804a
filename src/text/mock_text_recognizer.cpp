#include <deductly/text/mock_text_recognizer.hpp>

namespace deductly::text {

MockTextRecognizer::MockTextRecognizer(std::string text, std::optional<float> reliability)
    : result_{std::move(text), reliability} {}

void MockTextRecognizer::set_text(std::string text, std::optional<float> reliability) {
  result_.text = std::move(text);
  result_.reliability = reliability;
}

std::expected<RecognizedText, deductly::core::ScanError>
MockTextRecognizer::recognize(const deductly::core::Bitmap& input) {
  ++calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (fail_) {
    return std::unexpected(deductly::core::ScanError::RecognitionFailed);
  }
  return result_;
}

std::expected<void, deductly::core::ScanError>
MockTextRecognizer::validate_input(const deductly::core::Bitmap& input) const {
  if (input.empty()) {
    return std::unexpected(deductly::core::ScanError::RecognitionFailed);
  }
  return {};
}

}  // namespace deductly::text
