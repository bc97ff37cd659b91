#include "geomap/GeoToPixelMapper.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace geomap {

namespace {

int clampToRange(double value, int upper) {
  if (std::isnan(value)) {
    return 0;
  }
  if (value <= 0.0) {
    return 0;
  }
  if (value >= upper) {
    return upper;
  }
  return static_cast<int>(value);
}

} // namespace

BoundingBox GeoToPixelMapper::toPixelBox(const GeoExtent &extent, int width,
                                         int height) {
  width = std::max(0, width);
  height = std::max(0, height);

  double x1 = (extent.minLon + 180.0) / 360.0 * width;
  double x2 = (extent.maxLon + 180.0) / 360.0 * width;
  double y1 = (90.0 - extent.maxLat) / 180.0 * height;
  double y2 = (90.0 - extent.minLat) / 180.0 * height;

  BoundingBox box;
  box.x1 = clampToRange(x1, width);
  box.x2 = clampToRange(x2, width);
  box.y1 = clampToRange(y1, height);
  box.y2 = clampToRange(y2, height);
  return box;
}

cv::Point2d GeoToPixelMapper::pixelToGeo(const cv::Point2f &pixel, int width,
                                         int height) {
  double lon = width > 0 ? pixel.x / static_cast<double>(width) * 360.0 - 180.0
                         : 0.0;
  double lat = height > 0
                   ? 90.0 - pixel.y / static_cast<double>(height) * 180.0
                   : 0.0;
  return cv::Point2d(lon, lat);
}

GeoExtent GeoToPixelMapper::extentOf(const std::vector<Coordinate> &group) {
  GeoExtent extent;
  if (group.empty()) {
    return extent;
  }

  extent.minLat = std::numeric_limits<double>::max();
  extent.maxLat = std::numeric_limits<double>::lowest();
  extent.minLon = std::numeric_limits<double>::max();
  extent.maxLon = std::numeric_limits<double>::lowest();

  for (const auto &coord : group) {
    extent.minLat = std::min(extent.minLat, coord.groupingLat());
    extent.maxLat = std::max(extent.maxLat, coord.groupingLat());
    extent.minLon = std::min(extent.minLon, coord.groupingLon());
    extent.maxLon = std::max(extent.maxLon, coord.groupingLon());
  }
  return extent;
}

} // namespace geomap
