#include "geomap/GeoTypes.hpp"

#include <algorithm>
#include <climits>

namespace geomap {

cv::Point2f OcrFragment::centroid() const {
  if (polygon.empty()) {
    return cv::Point2f(0.f, 0.f);
  }

  int minX = INT_MAX, minY = INT_MAX, maxX = INT_MIN, maxY = INT_MIN;
  for (const auto &p : polygon) {
    minX = std::min(minX, p.x);
    minY = std::min(minY, p.y);
    maxX = std::max(maxX, p.x);
    maxY = std::max(maxY, p.y);
  }
  return cv::Point2f((minX + maxX) / 2.0f, (minY + maxY) / 2.0f);
}

double Coordinate::groupingLat() const {
  if (kind != CoordinateKind::Paired && anchored) {
    return anchorLat;
  }
  return lat;
}

double Coordinate::groupingLon() const {
  if (kind != CoordinateKind::Paired && anchored) {
    return anchorLon;
  }
  return lon;
}

std::string toString(JobState state) {
  switch (state) {
  case JobState::Processing:
    return "processing";
  case JobState::Completed:
    return "completed";
  case JobState::Failed:
    return "failed";
  }
  return "processing";
}

std::optional<JobState> jobStateFromString(const std::string &name) {
  if (name == "processing")
    return JobState::Processing;
  if (name == "completed")
    return JobState::Completed;
  if (name == "failed")
    return JobState::Failed;
  return std::nullopt;
}

std::string toString(CoordinateKind kind) {
  switch (kind) {
  case CoordinateKind::Paired:
    return "paired";
  case CoordinateKind::EastingOnly:
    return "easting";
  case CoordinateKind::NorthingOnly:
    return "northing";
  }
  return "paired";
}

std::optional<CoordinateKind> coordinateKindFromString(const std::string &name) {
  if (name == "paired")
    return CoordinateKind::Paired;
  if (name == "easting")
    return CoordinateKind::EastingOnly;
  if (name == "northing")
    return CoordinateKind::NorthingOnly;
  return std::nullopt;
}

bool operator==(const BoundingBox &a, const BoundingBox &b) {
  return a.x1 == b.x1 && a.y1 == b.y1 && a.x2 == b.x2 && a.y2 == b.y2;
}

bool operator!=(const BoundingBox &a, const BoundingBox &b) {
  return !(a == b);
}

bool operator==(const DetectedObject &a, const DetectedObject &b) {
  return a.bbox == b.bbox && a.className == b.className &&
         a.confidence == b.confidence;
}

bool operator==(const Coordinate &a, const Coordinate &b) {
  return a.kind == b.kind && a.lat == b.lat && a.lon == b.lon &&
         a.confidence == b.confidence && a.text == b.text &&
         a.anchored == b.anchored && a.anchorLat == b.anchorLat &&
         a.anchorLon == b.anchorLon;
}

bool operator==(const RegionOfInterest &a, const RegionOfInterest &b) {
  return a.coordinates == b.coordinates && a.segmentPath == b.segmentPath &&
         a.bbox == b.bbox;
}

bool operator==(const ProcessingResultData &a, const ProcessingResultData &b) {
  return a.detectedObjects == b.detectedObjects &&
         a.coordinates == b.coordinates && a.regions == b.regions;
}

bool operator!=(const ProcessingResultData &a, const ProcessingResultData &b) {
  return !(a == b);
}

} // namespace geomap
