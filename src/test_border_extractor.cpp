#include "geomap/BorderCoordinateExtractor.hpp"

#include <gtest/gtest.h>

namespace {

using geomap::BorderCoordinateExtractor;
using geomap::CoordinateKind;
using geomap::OcrFragment;

OcrFragment fragmentAt(const std::string &text, int x, int y, int w, int h,
                       float confidence) {
  OcrFragment fragment;
  fragment.text = text;
  fragment.polygon = {cv::Point(x, y), cv::Point(x + w, y),
                      cv::Point(x + w, y + h), cv::Point(x, y + h)};
  fragment.confidence = confidence;
  return fragment;
}

TEST(BorderCoordinateExtractorTest, MarginBands) {
  BorderCoordinateExtractor extractor;
  cv::Size size(1000, 500);

  EXPECT_TRUE(extractor.isInMargin(cv::Point2f(100, 250), size));
  EXPECT_TRUE(extractor.isInMargin(cv::Point2f(900, 250), size));
  EXPECT_TRUE(extractor.isInMargin(cv::Point2f(500, 50), size));
  EXPECT_TRUE(extractor.isInMargin(cv::Point2f(500, 450), size));
  EXPECT_FALSE(extractor.isInMargin(cv::Point2f(500, 250), size));
  EXPECT_FALSE(extractor.isInMargin(cv::Point2f(200, 100), size));
}

TEST(BorderCoordinateExtractorTest, ExtractsGridLabelsNearEdges) {
  BorderCoordinateExtractor extractor;
  cv::Size size(1000, 500);

  std::vector<OcrFragment> fragments = {
      fragmentAt("E 421500", 400, 5, 80, 20, 0.3f),
      fragmentAt("N 4422150", 5, 240, 80, 20, 0.3f),
      fragmentAt("E 421600", 460, 240, 80, 20, 0.9f), // interior
      fragmentAt("LEGEND", 900, 450, 80, 20, 0.9f),
  };

  auto matches = extractor.extract(size, fragments);
  ASSERT_EQ(matches.size(), 2u);

  EXPECT_EQ(matches[0].fragmentIndex, 0u);
  EXPECT_EQ(matches[0].coordinate.kind, CoordinateKind::EastingOnly);
  EXPECT_DOUBLE_EQ(matches[0].coordinate.lon, 421500.0);
  EXPECT_TRUE(matches[0].coordinate.anchored);

  EXPECT_EQ(matches[1].fragmentIndex, 1u);
  EXPECT_EQ(matches[1].coordinate.kind, CoordinateKind::NorthingOnly);
  EXPECT_DOUBLE_EQ(matches[1].coordinate.lat, 4422150.0);
  EXPECT_TRUE(matches[1].coordinate.anchored);
}

TEST(BorderCoordinateExtractorTest, AnchorIsCentroidInGeoFrame) {
  BorderCoordinateExtractor extractor;
  // 1 pixel = 0.1 degree on both axes
  cv::Size size(3600, 1800);

  std::vector<OcrFragment> fragments = {
      fragmentAt("E 421500", 90, 10, 20, 20, 0.8f),
  };
  auto matches = extractor.extract(size, fragments);
  ASSERT_EQ(matches.size(), 1u);

  const auto &coord = matches[0].coordinate;
  EXPECT_NEAR(coord.anchorLon, 100 / 10.0 - 180.0, 1e-9);
  EXPECT_NEAR(coord.anchorLat, 90.0 - 20 / 10.0, 1e-9);
  // The unpaired axis carries the positional proxy
  EXPECT_DOUBLE_EQ(coord.lat, coord.anchorLat);
  EXPECT_DOUBLE_EQ(coord.groupingLon(), coord.anchorLon);
}

TEST(BorderCoordinateExtractorTest, SkipsVeryLowConfidenceAndDecimals) {
  BorderCoordinateExtractor extractor;
  cv::Size size(1000, 500);

  std::vector<OcrFragment> fragments = {
      fragmentAt("E 421500", 5, 5, 80, 20, 0.05f),
      fragmentAt("40.7128 N, 74.0060 W", 5, 450, 200, 20, 0.9f),
  };
  EXPECT_TRUE(extractor.extract(size, fragments).empty());
}

TEST(BorderCoordinateExtractorTest, EmptyImageYieldsNothing) {
  BorderCoordinateExtractor extractor;
  std::vector<OcrFragment> fragments = {
      fragmentAt("E 421500", 0, 0, 10, 10, 0.9f),
  };
  EXPECT_TRUE(extractor.extract(cv::Size(0, 0), fragments).empty());
}

} // namespace
