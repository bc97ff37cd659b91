#include "geomap/SegmentExtractor.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace geomap {

SegmentExtractor::SegmentExtractor(const ArtifactStore &store,
                                   const SegmentConfig &config)
    : m_store(store), m_config(config), m_rng(std::random_device{}()) {}

BoundingBox SegmentExtractor::effectiveBox(const BoundingBox &bbox, int width,
                                           int height) const {
  if (bbox.isValidFor(width, height)) {
    return bbox;
  }

  BoundingBox fallback;
  fallback.x1 = 0;
  fallback.y1 = 0;
  fallback.x2 = std::min(m_config.fallbackSize, std::max(0, width));
  fallback.y2 = std::min(m_config.fallbackSize, std::max(0, height));
  return fallback;
}

std::string SegmentExtractor::errorMarker(const std::string &jobId) {
  return "segment_error_" + jobId;
}

std::string SegmentExtractor::randomSuffix() {
  std::lock_guard<std::mutex> lock(m_rngMutex);
  std::ostringstream out;
  out << std::hex << std::setw(8) << std::setfill('0')
      << static_cast<unsigned int>(m_rng());
  return out.str();
}

SegmentResult SegmentExtractor::extract(const cv::Mat &image,
                                        const BoundingBox &bbox,
                                        const std::string &jobId) {
  SegmentResult result;
  result.bbox = effectiveBox(bbox, image.cols, image.rows);

  if (result.bbox != bbox) {
    std::cerr << "[job " << jobId << "] Invalid segment box (" << bbox.x1
              << "," << bbox.y1 << "," << bbox.x2 << "," << bbox.y2
              << "), using default crop" << std::endl;
  }

  std::string filename = "segment_" + jobId + "_" + randomSuffix() + ".jpg";

  try {
    auto path = m_store.pathFor(filename);
    if (!path) {
      throw std::runtime_error("unsafe segment filename: " + filename);
    }

    cv::Mat segment = image(result.bbox.toRect());
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, m_config.jpegQuality};
    if (!cv::imwrite(path->string(), segment, params)) {
      throw std::runtime_error("cv::imwrite failed for " + path->string());
    }

    result.filename = filename;
    result.success = true;
  } catch (const std::exception &e) {
    std::cerr << "[job " << jobId << "] Failed to write segment: " << e.what()
              << std::endl;
    result.filename = errorMarker(jobId);
    result.errorMessage = e.what();
  }

  return result;
}

} // namespace geomap
