// Unit tests for TesseractTextRecognizer.
// The constructor failure test runs everywhere. Recognition tests need language
// data: set DEDUCTLY_TEST_TESSDATA to a tessdata directory containing eng.traineddata.
// They are skipped when the variable is unset or the directory is missing.
#include <deductly/core/bitmap.hpp>
#include <deductly/text/tesseract_text_recognizer.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace dc = deductly::core;
namespace dtx = deductly::text;

static std::string get_tessdata_path() {
  const char* env = std::getenv("DEDUCTLY_TEST_TESSDATA");
  if (env && env[0] != '\0' && std::filesystem::is_directory(env)) {
    return env;
  }
  return "";
}

static dc::Bitmap text_bitmap(const std::string& text) {
  cv::Mat img(120, 600, CV_8UC1, cv::Scalar(255));
  cv::putText(img, text, cv::Point(20, 80), cv::FONT_HERSHEY_SIMPLEX, 1.5, cv::Scalar(0), 3);
  std::vector<std::byte> buf(img.total());
  std::memcpy(buf.data(), img.data, buf.size());
  return dc::Bitmap(600, 120, dc::PixelFormat::Grayscale8, std::move(buf));
}

TEST(TesseractTextRecognizer, ConstructorThrowsForMissingLanguageData) {
  dtx::TesseractOptions options;
  options.data_path = "/nonexistent/tessdata";
  options.language = "eng";
  EXPECT_THROW(dtx::TesseractTextRecognizer recognizer(options), std::runtime_error);
}

TEST(TesseractTextRecognizer, RecognizesRenderedTotal) {
  const std::string tessdata = get_tessdata_path();
  if (tessdata.empty()) {
    GTEST_SKIP() << "DEDUCTLY_TEST_TESSDATA not set";
  }
  dtx::TesseractOptions options;
  options.data_path = tessdata;
  dtx::TesseractTextRecognizer recognizer(options);

  auto result = recognizer.recognize(text_bitmap("TOTAL 31.48"));
  ASSERT_TRUE(result.has_value());
  EXPECT_NE(result->text.find("31.48"), std::string::npos) << result->text;
  ASSERT_TRUE(result->reliability.has_value());
  EXPECT_GE(*result->reliability, 0.f);
  EXPECT_LE(*result->reliability, 1.f);
}

TEST(TesseractTextRecognizer, RejectsEmptyBitmap) {
  const std::string tessdata = get_tessdata_path();
  if (tessdata.empty()) {
    GTEST_SKIP() << "DEDUCTLY_TEST_TESSDATA not set";
  }
  dtx::TesseractOptions options;
  options.data_path = tessdata;
  dtx::TesseractTextRecognizer recognizer(options);
  EXPECT_FALSE(recognizer.recognize(dc::Bitmap{}).has_value());
}
