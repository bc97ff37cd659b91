#ifndef GEOMAP_MAP_PIPELINE_HPP
#define GEOMAP_MAP_PIPELINE_HPP

#include "geomap/ArtifactStore.hpp"
#include "geomap/BorderCoordinateExtractor.hpp"
#include "geomap/CoordinateParser.hpp"
#include "geomap/DetectionStage.hpp"
#include "geomap/GeoTypes.hpp"
#include "geomap/JobStore.hpp"
#include "geomap/OCRStage.hpp"
#include "geomap/PipelineConfig.hpp"
#include "geomap/ResultCache.hpp"
#include "geomap/SegmentExtractor.hpp"
#include "geomap/SpatialGrouper.hpp"
#include "geomap/ThreadPool.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace geomap {

/**
 * @brief The input image could not be read or decoded
 */
class ImageLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A job handed to the worker pool
 */
struct SubmittedJob {
  JobStatus status;                   ///< Status right after creation
  std::future<JobStatus> completion;  ///< Terminal status once the job ends
};

/**
 * @brief Runs map analysis jobs end to end
 *
 * Stages of one job run sequentially on a pool worker: detection, OCR,
 * coordinate extraction (border labels first, then general parsing of the
 * remaining confident fragments), grouping, geo-to-pixel mapping and segment
 * extraction. Detector and OCR failures degrade to fallback or empty
 * results; an unreadable image or any other exception fails the job.
 * Segment files written before a failure are kept.
 *
 * Example usage:
 * @code
 * geomap::MapPipeline pipeline(config, geomap::makeDetector(config.detection),
 *                              std::move(recognizer),
 *                              std::make_shared<geomap::InMemoryJobStore>(),
 *                              std::make_shared<geomap::InMemoryResultCache>());
 * auto job = pipeline.submit("map.png");
 * geomap::JobStatus status = job.completion.get();
 * @endcode
 */
class MapPipeline {
public:
  /**
   * @param cache May be null, results are then not cached
   */
  MapPipeline(const PipelineConfig &config, std::unique_ptr<Detector> detector,
              std::unique_ptr<TextRecognizer> recognizer,
              std::shared_ptr<JobStore> jobStore,
              std::shared_ptr<ResultCache> cache);
  ~MapPipeline();

  MapPipeline(const MapPipeline &) = delete;
  MapPipeline &operator=(const MapPipeline &) = delete;

  /**
   * @brief Create a job for an image and queue it
   * @param imagePath Image on local disk
   */
  SubmittedJob submit(const std::string &imagePath);

  /**
   * @brief Run every stage on an image synchronously
   * @throws ImageLoadError if the image cannot be decoded
   */
  ProcessingResultData processImage(const std::string &jobId,
                                    const std::string &imagePath);

  /**
   * @brief Process an already created job and record its terminal state
   * @return Status after the transition
   */
  JobStatus runJob(const std::string &jobId, const std::string &imagePath);

  std::optional<JobStatus> getJob(const std::string &jobId) const;

  /**
   * @brief Result of a completed job from the cache, if still present
   */
  std::optional<ProcessingResultData>
  cachedResult(const std::string &jobId) const;

  /**
   * @brief Resolve a segment file of a job
   *
   * Unsafe names, names not listed in the job's result and missing files all
   * yield nullopt.
   */
  std::optional<std::filesystem::path>
  segmentPath(const std::string &jobId, const std::string &filename) const;

  /**
   * @brief Collect coordinates from OCR fragments, in fragment order
   */
  std::vector<Coordinate>
  extractCoordinates(const cv::Size &imageSize,
                     const std::vector<OcrFragment> &fragments) const;

  const ArtifactStore &artifacts() const { return m_artifacts; }

  static std::string generateJobId();
  static std::string cacheKey(const std::string &jobId);

private:
  PipelineConfig m_config;
  DetectionStage m_detection;
  OCRStage m_ocr;
  CoordinateParser m_parser;
  BorderCoordinateExtractor m_borderExtractor;
  SpatialGrouper m_grouper;
  ArtifactStore m_artifacts;
  SegmentExtractor m_segments;
  std::shared_ptr<JobStore> m_jobStore;
  std::shared_ptr<ResultCache> m_cache;
  ThreadPool m_pool; ///< Declared last so workers stop before the stages go
};

} // namespace geomap

#endif // GEOMAP_MAP_PIPELINE_HPP
