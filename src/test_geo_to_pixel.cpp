#include "geomap/GeoToPixelMapper.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <random>

namespace {

using geomap::BoundingBox;
using geomap::GeoExtent;
using geomap::GeoToPixelMapper;

TEST(GeoToPixelMapperTest, LinearMapping) {
  GeoExtent extent{0.0, 45.0, 0.0, 90.0};
  BoundingBox box = GeoToPixelMapper::toPixelBox(extent, 360, 180);

  EXPECT_EQ(box.x1, 180);
  EXPECT_EQ(box.x2, 270);
  EXPECT_EQ(box.y1, 45);
  EXPECT_EQ(box.y2, 90);
}

TEST(GeoToPixelMapperTest, ClampsOutOfRangeExtents) {
  GeoExtent extent{-4422150.0, 4422150.0, -421500.0, 421500.0};
  BoundingBox box = GeoToPixelMapper::toPixelBox(extent, 800, 600);

  EXPECT_EQ(box.x1, 0);
  EXPECT_EQ(box.y1, 0);
  EXPECT_EQ(box.x2, 800);
  EXPECT_EQ(box.y2, 600);
}

TEST(GeoToPixelMapperTest, AlwaysInsideImage) {
  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> value(-1e7, 1e7);

  for (int i = 0; i < 500; i++) {
    GeoExtent extent{value(rng), value(rng), value(rng), value(rng)};
    BoundingBox box = GeoToPixelMapper::toPixelBox(extent, 640, 480);
    EXPECT_GE(box.x1, 0);
    EXPECT_GE(box.y1, 0);
    EXPECT_LE(box.x1, 640);
    EXPECT_LE(box.x2, 640);
    EXPECT_GE(box.x2, 0);
    EXPECT_LE(box.y1, 480);
    EXPECT_LE(box.y2, 480);
    EXPECT_GE(box.y2, 0);
  }
}

TEST(GeoToPixelMapperTest, NanAndInfinityAreClamped) {
  double nan = std::numeric_limits<double>::quiet_NaN();
  double inf = std::numeric_limits<double>::infinity();
  GeoExtent extent{nan, inf, -inf, nan};

  BoundingBox box = GeoToPixelMapper::toPixelBox(extent, 100, 50);
  EXPECT_GE(box.x1, 0);
  EXPECT_LE(box.x2, 100);
  EXPECT_GE(box.y1, 0);
  EXPECT_LE(box.y2, 50);
}

TEST(GeoToPixelMapperTest, PixelToGeoInvertsTheMapping) {
  cv::Point2d geo = GeoToPixelMapper::pixelToGeo(cv::Point2f(270, 45), 360, 180);
  EXPECT_DOUBLE_EQ(geo.x, 90.0);
  EXPECT_DOUBLE_EQ(geo.y, 45.0);
}

TEST(GeoToPixelMapperTest, ExtentUsesGroupingPosition) {
  geomap::Coordinate a;
  a.lat = 10.0;
  a.lon = 20.0;

  geomap::Coordinate b;
  b.kind = geomap::CoordinateKind::EastingOnly;
  b.lon = 421500.0;
  b.anchored = true;
  b.anchorLat = 12.0;
  b.anchorLon = 19.0;

  GeoExtent extent = GeoToPixelMapper::extentOf({a, b});
  EXPECT_DOUBLE_EQ(extent.minLat, 10.0);
  EXPECT_DOUBLE_EQ(extent.maxLat, 12.0);
  EXPECT_DOUBLE_EQ(extent.minLon, 19.0);
  EXPECT_DOUBLE_EQ(extent.maxLon, 20.0);
}

} // namespace
