#ifndef GEOMAP_BORDER_COORDINATE_EXTRACTOR_HPP
#define GEOMAP_BORDER_COORDINATE_EXTRACTOR_HPP

#include "geomap/CoordinateParser.hpp"
#include "geomap/GeoTypes.hpp"
#include "geomap/PipelineConfig.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace geomap {

/**
 * @brief A grid label found in the image margin
 */
struct BorderMatch {
  size_t fragmentIndex; ///< Index into the fragment list passed to extract()
  Coordinate coordinate;
};

/**
 * @brief Reads Easting/Northing grid labels printed along the map edges
 *
 * Only fragments whose centroid falls inside one of the four margin bands are
 * considered, since interior text is mostly place names and legend entries.
 * The centroid of each accepted fragment is converted into the equirectangular
 * frame and attached as the coordinate's anchor; the anchor also fills the
 * unpaired axis.
 */
class BorderCoordinateExtractor {
public:
  BorderCoordinateExtractor() = default;
  explicit BorderCoordinateExtractor(const BorderConfig &config);

  /**
   * @brief Extract grid labels from the margin bands
   * @param imageSize Size of the analysed image
   * @param fragments All OCR fragments of the image
   * @return One match per accepted fragment, in fragment order
   */
  std::vector<BorderMatch>
  extract(const cv::Size &imageSize,
          const std::vector<OcrFragment> &fragments) const;

  /**
   * @brief Whether a point lies in the left/right/top/bottom margin band
   */
  bool isInMargin(const cv::Point2f &point, const cv::Size &imageSize) const;

private:
  BorderConfig m_config;
  CoordinateParser m_parser;
};

} // namespace geomap

#endif // GEOMAP_BORDER_COORDINATE_EXTRACTOR_HPP
