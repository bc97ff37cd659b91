#ifndef GEOMAP_GEO_TYPES_HPP
#define GEOMAP_GEO_TYPES_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geomap {

/**
 * @brief Pixel rectangle given by two corners (x1,y1) top-left, (x2,y2)
 * bottom-right
 */
struct BoundingBox {
  int x1 = 0;
  int y1 = 0;
  int x2 = 0;
  int y2 = 0;

  /**
   * @brief Check that the box is non-empty and lies inside a w x h image
   * @return true if 0 <= x1 < x2 <= w and 0 <= y1 < y2 <= h
   */
  bool isValidFor(int width, int height) const {
    return x1 >= 0 && x1 < x2 && x2 <= width && y1 >= 0 && y1 < y2 &&
           y2 <= height;
  }

  cv::Rect toRect() const { return cv::Rect(x1, y1, x2 - x1, y2 - y1); }

  static BoundingBox fromRect(const cv::Rect &rect) {
    return {rect.x, rect.y, rect.x + rect.width, rect.y + rect.height};
  }
};

/**
 * @brief A region found by a detector
 */
struct DetectedObject {
  BoundingBox bbox;       ///< Pixel bounding box
  std::string className;  ///< Cartographic class label
  float confidence = 0.f; ///< Detector confidence (0-1)
};

/**
 * @brief One recognized text fragment returned by an OCR engine
 */
struct OcrFragment {
  std::string text;                ///< Recognized text
  std::vector<cv::Point> polygon;  ///< Corners in image space
  float confidence = 0.f;          ///< Recognition confidence (0-1)

  /**
   * @brief Centre of the polygon's bounding rectangle
   */
  cv::Point2f centroid() const;
};

/**
 * @brief Which axes of a Coordinate carry geodetic values
 */
enum class CoordinateKind {
  Paired,      ///< Both lat and lon are geographic degrees
  EastingOnly, ///< lon holds a raw easting, lat holds a placeholder
  NorthingOnly ///< lat holds a raw northing, lon holds a placeholder
};

/**
 * @brief A coordinate annotation recovered from map text
 *
 * Axis-only labels (raw Easting/Northing values printed in the margin) keep
 * the unpaired axis as a placeholder. When the label position in the image is
 * known, the anchor holds that position expressed in the equirectangular frame
 * used by GeoToPixelMapper; it is only a grouping and placement hint.
 */
struct Coordinate {
  CoordinateKind kind = CoordinateKind::Paired;
  double lat = 0.0;
  double lon = 0.0;
  float confidence = 0.f;
  std::string text; ///< Original OCR string

  bool anchored = false; ///< Whether anchorLat/anchorLon are set
  double anchorLat = 0.0;
  double anchorLon = 0.0;

  /// Latitude used for grouping and extent computation
  double groupingLat() const;
  /// Longitude used for grouping and extent computation
  double groupingLon() const;
};

/**
 * @brief A cluster of coordinates together with its extracted image crop
 */
struct RegionOfInterest {
  std::vector<Coordinate> coordinates;
  std::string segmentPath; ///< Artifact filename, relative to artifact store
  BoundingBox bbox;
};

/**
 * @brief Everything produced for one job
 */
struct ProcessingResultData {
  std::vector<DetectedObject> detectedObjects;
  std::vector<Coordinate> coordinates;
  std::vector<RegionOfInterest> regions;
};

/**
 * @brief Lifecycle state of a job
 */
enum class JobState { Processing, Completed, Failed };

/**
 * @brief Information recorded about the submitted file
 */
struct JobMetadata {
  std::string originalFilename;
  std::uintmax_t fileSize = 0;
};

/**
 * @brief Persisted state of one job
 */
struct JobStatus {
  std::string jobId;
  JobState state = JobState::Processing;
  std::string message;
  std::string imagePath;
  std::string originalFilename;
  std::uintmax_t fileSize = 0;
  std::string createdAt; ///< ISO-8601 UTC
  std::string updatedAt; ///< ISO-8601 UTC
  std::optional<ProcessingResultData> result;
  std::optional<std::string> errorInfo;

  bool isTerminal() const { return state != JobState::Processing; }
};

std::string toString(JobState state);
std::optional<JobState> jobStateFromString(const std::string &name);

std::string toString(CoordinateKind kind);
std::optional<CoordinateKind> coordinateKindFromString(const std::string &name);

bool operator==(const BoundingBox &a, const BoundingBox &b);
bool operator!=(const BoundingBox &a, const BoundingBox &b);
bool operator==(const DetectedObject &a, const DetectedObject &b);
bool operator==(const Coordinate &a, const Coordinate &b);
bool operator==(const RegionOfInterest &a, const RegionOfInterest &b);
bool operator==(const ProcessingResultData &a, const ProcessingResultData &b);
bool operator!=(const ProcessingResultData &a, const ProcessingResultData &b);

} // namespace geomap

#endif // GEOMAP_GEO_TYPES_HPP
