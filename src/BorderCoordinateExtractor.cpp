#include "geomap/BorderCoordinateExtractor.hpp"

#include "geomap/GeoToPixelMapper.hpp"

namespace geomap {

BorderCoordinateExtractor::BorderCoordinateExtractor(const BorderConfig &config)
    : m_config(config) {}

bool BorderCoordinateExtractor::isInMargin(const cv::Point2f &point,
                                           const cv::Size &imageSize) const {
  double marginX = imageSize.width * m_config.marginRatio;
  double marginY = imageSize.height * m_config.marginRatio;

  return point.x <= marginX || point.x >= imageSize.width - marginX ||
         point.y <= marginY || point.y >= imageSize.height - marginY;
}

std::vector<BorderMatch> BorderCoordinateExtractor::extract(
    const cv::Size &imageSize, const std::vector<OcrFragment> &fragments) const {
  std::vector<BorderMatch> matches;

  if (imageSize.width <= 0 || imageSize.height <= 0) {
    return matches;
  }

  for (size_t i = 0; i < fragments.size(); i++) {
    const OcrFragment &fragment = fragments[i];
    if (fragment.confidence < m_config.minConfidence ||
        fragment.polygon.empty()) {
      continue;
    }

    cv::Point2f centroid = fragment.centroid();
    if (!isInMargin(centroid, imageSize)) {
      continue;
    }

    cv::Point2d anchor = GeoToPixelMapper::pixelToGeo(
        centroid, imageSize.width, imageSize.height);

    // Easting labels lack a latitude, northing labels lack a longitude
    auto coord = m_parser.parseGridLabel(fragment.text, fragment.confidence);
    if (!coord) {
      continue;
    }
    if (coord->kind == CoordinateKind::EastingOnly) {
      coord->lat = anchor.y;
    } else {
      coord->lon = anchor.x;
    }
    coord->anchored = true;
    coord->anchorLat = anchor.y;
    coord->anchorLon = anchor.x;

    matches.push_back({i, *coord});
  }

  return matches;
}

} // namespace geomap
