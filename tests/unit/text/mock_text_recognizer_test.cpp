#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/text/mock_text_recognizer.hpp>
#include <gtest/gtest.h>
#include <memory>

namespace dc = deductly::core;
namespace dtx = deductly::text;

TEST(MockTextRecognizer, DefaultReturnsEmptyText) {
  dtx::MockTextRecognizer mock;
  auto result = mock.recognize(dc::Bitmap::filled(4, 4, 255));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->text.empty());
  EXPECT_FALSE(result->reliability.has_value());
}

TEST(MockTextRecognizer, ReturnsCannedTextAndReliability) {
  dtx::MockTextRecognizer mock;
  mock.set_text("TOTAL: $5.00", 0.9f);
  auto result = mock.recognize(dc::Bitmap::filled(4, 4, 255));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->text, "TOTAL: $5.00");
  ASSERT_TRUE(result->reliability.has_value());
  EXPECT_FLOAT_EQ(*result->reliability, 0.9f);
  EXPECT_EQ(mock.call_count(), 1u);
}

TEST(MockTextRecognizer, EmptyBitmapRejected) {
  dtx::MockTextRecognizer mock("text");
  EXPECT_FALSE(mock.validate_input(dc::Bitmap{}).has_value());
  auto result = mock.recognize(dc::Bitmap{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), dc::ScanError::RecognitionFailed);
}

TEST(MockTextRecognizer, InjectedFailure) {
  dtx::MockTextRecognizer mock("text");
  mock.set_failure(true);
  auto result = mock.recognize(dc::Bitmap::filled(2, 2, 0));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), dc::ScanError::RecognitionFailed);
}

TEST(MockTextRecognizer, UsableThroughInterface) {
  auto mock = std::make_unique<dtx::MockTextRecognizer>("hello");
  std::unique_ptr<dtx::ITextRecognizer> recognizer = std::move(mock);
  recognizer->warmup();
  EXPECT_EQ(recognizer->name(), "mock");
  auto result = recognizer->recognize(dc::Bitmap::filled(2, 2, 0));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->text, "hello");
}
