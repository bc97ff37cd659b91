#ifndef GEOMAP_SEGMENT_EXTRACTOR_HPP
#define GEOMAP_SEGMENT_EXTRACTOR_HPP

#include "geomap/ArtifactStore.hpp"
#include "geomap/GeoTypes.hpp"
#include "geomap/PipelineConfig.hpp"

#include <opencv2/core.hpp>

#include <mutex>
#include <random>
#include <string>

namespace geomap {

/**
 * @brief Result of writing one segment
 */
struct SegmentResult {
  bool success = false;     ///< Whether the crop was written
  std::string filename;     ///< Artifact filename, or the error marker
  BoundingBox bbox;         ///< Box that was actually cropped
  std::string errorMessage; ///< Error message if failed
};

/**
 * @brief Crops image regions and stores them in the artifact store
 *
 * Segment writing is best effort: an invalid box is replaced by a small
 * top-left crop and a failed write returns an error-marker filename instead of
 * throwing.
 */
class SegmentExtractor {
public:
  SegmentExtractor(const ArtifactStore &store, const SegmentConfig &config);

  /**
   * @brief Crop bbox out of image and write it as segment_<job>_<rand>.jpg
   * @param image Source image
   * @param bbox Requested crop in pixel coordinates
   * @param jobId Owning job, used in the filename
   */
  SegmentResult extract(const cv::Mat &image, const BoundingBox &bbox,
                        const std::string &jobId);

  /**
   * @brief The box that extract() would crop for a request
   * @return bbox if valid for the image, otherwise the default top-left crop
   */
  BoundingBox effectiveBox(const BoundingBox &bbox, int width,
                           int height) const;

  static std::string errorMarker(const std::string &jobId);

private:
  std::string randomSuffix();

  const ArtifactStore &m_store;
  SegmentConfig m_config;
  std::mt19937 m_rng;
  std::mutex m_rngMutex;
};

} // namespace geomap

#endif // GEOMAP_SEGMENT_EXTRACTOR_HPP
