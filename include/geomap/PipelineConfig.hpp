#ifndef GEOMAP_PIPELINE_CONFIG_HPP
#define GEOMAP_PIPELINE_CONFIG_HPP

#include <tesseract/publictypes.h>

#include <string>

namespace geomap {

/**
 * @brief Configuration options for region detection
 */
struct DetectionConfig {
  std::string modelPath = "models/yolov8n.onnx"; ///< ONNX detector model
  int inputSize = 640;          ///< Square network input size in pixels
  float confThreshold = 0.25f;  ///< Minimum detection confidence (0-1)
  float nmsThreshold = 0.45f;   ///< Non-maximum suppression IoU threshold
  double fallbackMinArea = 100; ///< Smallest contour kept by the fallback
  float fallbackConfidence = 0.5f; ///< Nominal fallback confidence
};

/**
 * @brief Configuration options for OCR processing
 */
struct OcrConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SPARSE_TEXT; ///< Map labels are scattered, not paragraphs
  bool preprocessImage = true;    ///< Grayscale, denoise, adaptive threshold
  bool scanRotations = true;      ///< Also read text rotated by 90/180/270
  float minConfidence = 0.5f;     ///< Gate for general coordinate parsing
  std::string tessDataPath = "";  ///< Path to tessdata (empty = environment)
};

/**
 * @brief Margin band used for map-grid labels
 */
struct BorderConfig {
  double marginRatio = 0.15;  ///< Band width as fraction of width/height
  float minConfidence = 0.1f; ///< Border labels may be read less reliably
};

struct GroupingConfig {
  double threshold = 1.0; ///< Max |dlat| and |dlon| between group members
};

struct SegmentConfig {
  int fallbackSize = 100; ///< Side of the default top-left crop
  int jpegQuality = 95;
};

/**
 * @brief Complete configuration of the map analysis pipeline
 */
struct PipelineConfig {
  std::string artifactDir = "uploads"; ///< Directory for segment images
  int workerThreads = 2;               ///< Size of the job worker pool
  int cacheTtlSeconds = 3600;          ///< Lifetime of cached results
  bool enableCache = true;

  DetectionConfig detection;
  OcrConfig ocr;
  BorderConfig border;
  GroupingConfig grouping;
  SegmentConfig segment;

  /**
   * @brief Default configuration with environment overrides applied
   *
   * Reads GEOMAP_ARTIFACT_DIR, GEOMAP_MODEL_PATH, TESSDATA_PREFIX,
   * GEOMAP_WORKERS and GEOMAP_CACHE_TTL. Malformed numbers are reported and
   * ignored.
   */
  static PipelineConfig fromEnvironment();
};

} // namespace geomap

#endif // GEOMAP_PIPELINE_CONFIG_HPP
