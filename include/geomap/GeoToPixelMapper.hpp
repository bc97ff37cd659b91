#ifndef GEOMAP_GEO_TO_PIXEL_MAPPER_HPP
#define GEOMAP_GEO_TO_PIXEL_MAPPER_HPP

#include "geomap/GeoTypes.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace geomap {

/**
 * @brief Geographic bounds of a coordinate group
 */
struct GeoExtent {
  double minLat = 0.0;
  double maxLat = 0.0;
  double minLon = 0.0;
  double maxLon = 0.0;
};

/**
 * @brief Equirectangular approximation between degrees and pixels
 *
 * The whole image is treated as spanning lon [-180,180] x lat [90,-90]. There
 * is no projection or datum handling; the mapping only needs to be good enough
 * to pick a rough crop region.
 */
class GeoToPixelMapper {
public:
  /**
   * @brief Map a geographic extent to a pixel box clamped to [0,w]x[0,h]
   *
   * Inputs outside the valid degree ranges (or NaN) clamp to the image
   * frame rather than failing.
   */
  static BoundingBox toPixelBox(const GeoExtent &extent, int width,
                                int height);

  /**
   * @brief Inverse mapping of an image position
   * @return Point with x = longitude and y = latitude
   */
  static cv::Point2d pixelToGeo(const cv::Point2f &pixel, int width,
                                int height);

  /**
   * @brief Bounds of the grouping points of a group
   * @param group Non-empty coordinate group
   */
  static GeoExtent extentOf(const std::vector<Coordinate> &group);
};

} // namespace geomap

#endif // GEOMAP_GEO_TO_PIXEL_MAPPER_HPP
