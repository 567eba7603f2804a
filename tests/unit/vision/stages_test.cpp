#include "cv_test_utils.hpp"
#include <deductly/core/bitmap.hpp>
#include <deductly/core/error.hpp>
#include <deductly/vision/binarize_stage.hpp>
#include <deductly/vision/contrast_stage.hpp>
#include <deductly/vision/denoise_stage.hpp>
#include <deductly/vision/grayscale_stage.hpp>
#include <deductly/vision/morphology_stage.hpp>
#include <deductly/vision/resize_stage.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

namespace dc = deductly::core;
namespace dv = deductly::vision;
namespace dt = deductly::test;

TEST(GrayscaleStage, ConvertsColorToSingleChannel) {
  cv::Mat bgr(20, 30, CV_8UC3, cv::Scalar(255, 255, 255));
  dv::GrayscaleStage stage;
  auto out = stage.process(dt::to_bitmap(bgr, dc::PixelFormat::BGR8));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), dc::PixelFormat::Grayscale8);
  EXPECT_EQ(out->width(), 30u);
  EXPECT_EQ(out->height(), 20u);
  EXPECT_EQ(std::to_integer<int>(out->data()[0]), 255);
}

TEST(GrayscaleStage, InvalidBitmapFails) {
  dv::GrayscaleStage stage;
  auto out = stage.process(dc::Bitmap{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), dc::ScanError::PreprocessingDegraded);
}

TEST(DenoiseStage, RequiresGrayscale) {
  cv::Mat bgr(20, 20, CV_8UC3, cv::Scalar(10, 20, 30));
  dv::DenoiseStage stage(9, 75.0, 3);
  auto out = stage.process(dt::to_bitmap(bgr, dc::PixelFormat::BGR8));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), dc::ScanError::PreprocessingDegraded);
}

TEST(DenoiseStage, RemovesIsolatedSpeck) {
  cv::Mat gray(40, 40, CV_8UC1, cv::Scalar(200));
  gray.at<unsigned char>(20, 20) = 0;
  dv::DenoiseStage stage(5, 50.0, 3);
  auto out = stage.process(dt::to_bitmap(gray, dc::PixelFormat::Grayscale8));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 40u);
  EXPECT_GT(dt::to_mat(*out).at<unsigned char>(20, 20), 150);
}

TEST(ContrastStage, KeepsDimensions) {
  cv::Mat gray(64, 48, CV_8UC1);
  cv::randu(gray, cv::Scalar(100), cv::Scalar(140));
  dv::ContrastStage stage(2.0, 8);
  auto out = stage.process(dt::to_bitmap(gray, dc::PixelFormat::Grayscale8));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 48u);
  EXPECT_EQ(out->height(), 64u);
  EXPECT_EQ(out->format(), dc::PixelFormat::Grayscale8);
}

TEST(BinarizeStage, OutputIsTwoTone) {
  auto img = dt::receipt_image();
  cv::Mat gray;
  cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
  dv::BinarizeStage stage(11, 2.0);
  auto out = stage.process(dt::to_bitmap(gray, dc::PixelFormat::Grayscale8));
  ASSERT_TRUE(out.has_value());
  for (auto px : out->data()) {
    const int v = std::to_integer<int>(px);
    ASSERT_TRUE(v == 0 || v == 255) << v;
  }
}

TEST(MorphologyStage, CloseThenOpenFillsPinhole) {
  cv::Mat gray(30, 30, CV_8UC1, cv::Scalar(255));
  gray.at<unsigned char>(15, 15) = 0;
  dv::MorphologyStage stage(3);
  auto out = stage.process(dt::to_bitmap(gray, dc::PixelFormat::Grayscale8));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(dt::to_mat(*out).at<unsigned char>(15, 15), 255);
}

TEST(ResizeStage, KeepsAspectRatio) {
  dv::ResizeStage stage(50);
  auto out = stage.process(dc::Bitmap::filled(200, 100, 128));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->height(), 50u);
  EXPECT_EQ(out->width(), 100u);
}

TEST(ResizeStage, SameHeightPassesThrough) {
  dv::ResizeStage stage(100);
  auto out = stage.process(dc::Bitmap::filled(37, 100, 9));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 37u);
}

TEST(ResizeStage, ZeroTargetFails) {
  dv::ResizeStage stage(0);
  EXPECT_FALSE(stage.process(dc::Bitmap::filled(10, 10, 0)).has_value());
}
