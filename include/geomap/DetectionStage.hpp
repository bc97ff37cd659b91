#ifndef GEOMAP_DETECTION_STAGE_HPP
#define GEOMAP_DETECTION_STAGE_HPP

#include "geomap/GeoTypes.hpp"
#include "geomap/PipelineConfig.hpp"

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace geomap {

/**
 * @brief Region detector capability
 *
 * Implementations may throw; DetectionStage guards every call.
 */
class Detector {
public:
  virtual ~Detector() = default;

  /**
   * @brief Detect candidate regions in an image
   * @param image BGR, BGRA or grayscale image
   * @return Detections in detector order
   */
  virtual std::vector<DetectedObject> detect(const cv::Mat &image) = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief YOLOv8 detector loaded from an ONNX file with OpenCV DNN
 *
 * Class ids map to cartographic labels: 0 text, 1 legend, 2 scale_bar,
 * 3 grid_line; anything else is reported as "unknown".
 */
class ModelDetector : public Detector {
public:
  explicit ModelDetector(const DetectionConfig &config);

  /**
   * @brief Load the network
   * @return true if the model was loaded, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  std::vector<DetectedObject> detect(const cv::Mat &image) override;
  std::string name() const override { return "yolo"; }

  static std::string classNameFor(int classId);

private:
  cv::Mat toBgr(const cv::Mat &image) const;

  DetectionConfig m_config;
  cv::dnn::Net m_net; ///< Not re-entrant, guarded by m_mutex
  std::mutex m_mutex;
  bool m_initialized;
};

/**
 * @brief Deterministic contour-based detector used without a model
 *
 * Runs Canny edge detection, takes external contours, approximates each as a
 * polygon and buckets it by vertex count: 4 vertices is a rectangle_region,
 * more than 8 is a circle_region, anything else a polygon_region. All
 * detections carry the same nominal confidence.
 */
class ShapeFallbackDetector : public Detector {
public:
  ShapeFallbackDetector() = default;
  explicit ShapeFallbackDetector(const DetectionConfig &config);

  std::vector<DetectedObject> detect(const cv::Mat &image) override;
  std::string name() const override { return "shape-fallback"; }

  static std::string classifyVertexCount(size_t vertices);

private:
  DetectionConfig m_config;
};

/**
 * @brief Choose the primary detector once, based on model availability
 * @return ModelDetector when the model file exists and loads, otherwise
 * ShapeFallbackDetector
 */
std::unique_ptr<Detector> makeDetector(const DetectionConfig &config);

/**
 * @brief Runs the primary detector with the contour fallback behind it
 *
 * When no primary detector is configured, or it throws, the fallback runs.
 * The stage itself never throws; an empty list is a valid result.
 */
class DetectionStage {
public:
  DetectionStage(std::unique_ptr<Detector> detector,
                 const DetectionConfig &config);

  std::vector<DetectedObject> run(const cv::Mat &image);

private:
  std::unique_ptr<Detector> m_detector;
  ShapeFallbackDetector m_fallback;
};

} // namespace geomap

#endif // GEOMAP_DETECTION_STAGE_HPP
