#include "geomap/MapPipeline.hpp"

#include "geomap/GeoToPixelMapper.hpp"
#include "geomap/ResultSerializer.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

namespace geomap {

namespace {

// Axis-only labels get the label position for the axis they do not carry
void anchorAxisLabel(Coordinate &coord, const cv::Point2d &anchor) {
  if (coord.kind == CoordinateKind::Paired) {
    return;
  }
  if (coord.kind == CoordinateKind::EastingOnly) {
    coord.lat = anchor.y;
  } else {
    coord.lon = anchor.x;
  }
  coord.anchored = true;
  coord.anchorLat = anchor.y;
  coord.anchorLon = anchor.x;
}

} // namespace

MapPipeline::MapPipeline(const PipelineConfig &config,
                         std::unique_ptr<Detector> detector,
                         std::unique_ptr<TextRecognizer> recognizer,
                         std::shared_ptr<JobStore> jobStore,
                         std::shared_ptr<ResultCache> cache)
    : m_config(config), m_detection(std::move(detector), config.detection),
      m_ocr(std::move(recognizer), config.ocr),
      m_borderExtractor(config.border), m_grouper(config.grouping),
      m_artifacts(config.artifactDir), m_segments(m_artifacts, config.segment),
      m_jobStore(std::move(jobStore)),
      m_cache(config.enableCache ? std::move(cache) : nullptr),
      m_pool(static_cast<size_t>(std::max(1, config.workerThreads))) {
  if (!m_jobStore) {
    throw std::invalid_argument("MapPipeline requires a job store");
  }
}

MapPipeline::~MapPipeline() = default;

std::string MapPipeline::generateJobId() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<int> nibble(0, 15);

  // RFC 4122 version 4: 8-4-4-4-12 hex digits
  std::ostringstream out;
  out << std::hex;
  for (int i = 0; i < 32; i++) {
    if (i == 8 || i == 12 || i == 16 || i == 20) {
      out << '-';
    }
    int value = nibble(rng);
    if (i == 12) {
      value = 4;
    } else if (i == 16) {
      value = 8 | (value & 0x3);
    }
    out << value;
  }
  return out.str();
}

std::string MapPipeline::cacheKey(const std::string &jobId) {
  return "job:" + jobId;
}

SubmittedJob MapPipeline::submit(const std::string &imagePath) {
  std::string jobId = generateJobId();

  JobMetadata metadata;
  metadata.originalFilename =
      std::filesystem::path(imagePath).filename().string();
  std::error_code ec;
  auto size = std::filesystem::file_size(imagePath, ec);
  metadata.fileSize = ec ? 0 : size;

  SubmittedJob job;
  job.status = m_jobStore->create(jobId, imagePath, metadata);
  std::cerr << "[job " << jobId << "] queued " << imagePath << std::endl;

  job.completion = m_pool.submit(
      [this, jobId, imagePath]() { return runJob(jobId, imagePath); });
  return job;
}

std::vector<Coordinate>
MapPipeline::extractCoordinates(const cv::Size &imageSize,
                                const std::vector<OcrFragment> &fragments) const {
  std::vector<std::optional<Coordinate>> byFragment(fragments.size());

  for (const auto &match : m_borderExtractor.extract(imageSize, fragments)) {
    byFragment[match.fragmentIndex] = match.coordinate;
  }

  for (size_t i = 0; i < fragments.size(); i++) {
    if (byFragment[i] || fragments[i].confidence <= m_config.ocr.minConfidence) {
      continue;
    }

    auto coord = m_parser.parse(fragments[i].text, fragments[i].confidence);
    if (!coord) {
      continue;
    }
    if (!fragments[i].polygon.empty()) {
      anchorAxisLabel(*coord,
                      GeoToPixelMapper::pixelToGeo(fragments[i].centroid(),
                                                   imageSize.width,
                                                   imageSize.height));
    }
    byFragment[i] = *coord;
  }

  std::vector<Coordinate> coordinates;
  for (auto &coord : byFragment) {
    if (coord) {
      coordinates.push_back(std::move(*coord));
    }
  }
  return coordinates;
}

ProcessingResultData MapPipeline::processImage(const std::string &jobId,
                                               const std::string &imagePath) {
  cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR);
  if (image.empty()) {
    throw ImageLoadError("Could not load image: " + imagePath);
  }

  ProcessingResultData result;
  result.detectedObjects = m_detection.run(image);
  std::cerr << "DEBUG: [job " << jobId << "] "
            << result.detectedObjects.size() << " objects detected"
            << std::endl;

  std::vector<OcrFragment> fragments = m_ocr.run(image);
  std::cerr << "DEBUG: [job " << jobId << "] " << fragments.size()
            << " text fragments" << std::endl;

  result.coordinates = extractCoordinates(image.size(), fragments);

  for (auto &group : m_grouper.group(result.coordinates)) {
    GeoExtent extent = GeoToPixelMapper::extentOf(group);
    BoundingBox box =
        GeoToPixelMapper::toPixelBox(extent, image.cols, image.rows);
    SegmentResult segment = m_segments.extract(image, box, jobId);

    RegionOfInterest region;
    region.coordinates = std::move(group);
    region.segmentPath = segment.filename;
    region.bbox = segment.bbox;
    result.regions.push_back(std::move(region));
  }

  std::cerr << "DEBUG: [job " << jobId << "] " << result.coordinates.size()
            << " coordinates in " << result.regions.size() << " regions"
            << std::endl;
  return result;
}

JobStatus MapPipeline::runJob(const std::string &jobId,
                              const std::string &imagePath) {
  auto start = std::chrono::steady_clock::now();

  try {
    ProcessingResultData result = processImage(jobId, imagePath);
    if (!m_jobStore->complete(jobId, result)) {
      std::cerr << "[job " << jobId << "] not in processing state, result "
                << "discarded" << std::endl;
    } else if (m_cache) {
      m_cache->set(cacheKey(jobId), ResultSerializer::toJson(result),
                   std::chrono::seconds(m_config.cacheTtlSeconds));
    }
  } catch (const std::exception &e) {
    std::cerr << "[job " << jobId << "] failed: " << e.what() << std::endl;
    m_jobStore->fail(jobId, e.what());
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  std::cerr << "[job " << jobId << "] finished in " << elapsed.count() << " ms"
            << std::endl;

  auto status = m_jobStore->get(jobId);
  if (!status) {
    throw std::runtime_error("Job " + jobId + " is missing from the store");
  }
  return *status;
}

std::optional<JobStatus> MapPipeline::getJob(const std::string &jobId) const {
  return m_jobStore->get(jobId);
}

std::optional<ProcessingResultData>
MapPipeline::cachedResult(const std::string &jobId) const {
  if (!m_cache) {
    return std::nullopt;
  }
  auto json = m_cache->get(cacheKey(jobId));
  if (!json) {
    return std::nullopt;
  }
  return ResultSerializer::fromJson(*json);
}

std::optional<std::filesystem::path>
MapPipeline::segmentPath(const std::string &jobId,
                         const std::string &filename) const {
  if (!ArtifactStore::isSafeFilename(filename)) {
    return std::nullopt;
  }

  auto status = m_jobStore->get(jobId);
  if (!status || !status->result) {
    return std::nullopt;
  }

  const auto &regions = status->result->regions;
  bool listed = std::any_of(regions.begin(), regions.end(),
                            [&filename](const RegionOfInterest &region) {
                              return region.segmentPath == filename;
                            });
  if (!listed) {
    return std::nullopt;
  }
  return m_artifacts.locate(filename);
}

} // namespace geomap
