#include "geomap/OCRStage.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using geomap::OcrConfig;
using geomap::OcrFragment;
using geomap::OCRStage;
using geomap::TextRecognizer;

class ThrowingRecognizer : public TextRecognizer {
public:
  std::vector<OcrFragment> readText(const cv::Mat &) override {
    throw std::runtime_error("engine unavailable");
  }
};

class RecordingRecognizer : public TextRecognizer {
public:
  explicit RecordingRecognizer(int *channels) : m_channels(channels) {}

  std::vector<OcrFragment> readText(const cv::Mat &image) override {
    *m_channels = image.channels();
    OcrFragment fragment;
    fragment.text = "E 421500";
    fragment.polygon = {{0, 0}, {10, 0}, {10, 5}, {0, 5}};
    fragment.confidence = 0.6f;
    return {fragment};
  }

private:
  int *m_channels;
};

TEST(OCRStageTest, RecognizerFailureYieldsNoText) {
  OCRStage stage(std::make_unique<ThrowingRecognizer>(), OcrConfig());
  cv::Mat image(50, 50, CV_8UC3, cv::Scalar(255, 255, 255));

  std::vector<OcrFragment> fragments;
  ASSERT_NO_THROW(fragments = stage.run(image));
  EXPECT_TRUE(fragments.empty());
}

TEST(OCRStageTest, MissingRecognizerYieldsNoText) {
  OCRStage stage(nullptr, OcrConfig());
  cv::Mat image(50, 50, CV_8UC3, cv::Scalar(255, 255, 255));
  EXPECT_TRUE(stage.run(image).empty());
}

TEST(OCRStageTest, PreprocessingFeedsBinaryImage) {
  int channels = 0;
  OCRStage stage(std::make_unique<RecordingRecognizer>(&channels),
                 OcrConfig());
  cv::Mat image(50, 50, CV_8UC3, cv::Scalar(120, 130, 140));

  auto fragments = stage.run(image);
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].text, "E 421500");
  EXPECT_EQ(channels, 1);
}

TEST(OCRStageTest, PreprocessingCanBeDisabled) {
  int channels = 0;
  OcrConfig config;
  config.preprocessImage = false;
  OCRStage stage(std::make_unique<RecordingRecognizer>(&channels), config);

  stage.run(cv::Mat(50, 50, CV_8UC3, cv::Scalar(0, 0, 0)));
  EXPECT_EQ(channels, 3);
}

TEST(OCRStageTest, PreprocessedImageIsBinary) {
  cv::Mat image(60, 60, CV_8UC3, cv::Scalar(90, 90, 90));
  cv::Mat processed = OCRStage::preprocessImage(image);

  ASSERT_EQ(processed.channels(), 1);
  for (int y = 0; y < processed.rows; y++) {
    for (int x = 0; x < processed.cols; x++) {
      uchar value = processed.at<uchar>(y, x);
      ASSERT_TRUE(value == 0 || value == 255);
    }
  }
}

TEST(OcrFragmentTest, CentroidOfPolygonBounds) {
  OcrFragment fragment;
  fragment.polygon = {{10, 20}, {30, 20}, {30, 31}, {10, 31}};
  cv::Point2f centroid = fragment.centroid();
  EXPECT_FLOAT_EQ(centroid.x, 20.0f);
  EXPECT_FLOAT_EQ(centroid.y, 25.5f);
}

} // namespace
