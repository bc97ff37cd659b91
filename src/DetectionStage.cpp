#include "geomap/DetectionStage.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace geomap {

ModelDetector::ModelDetector(const DetectionConfig &config)
    : m_config(config), m_initialized(false) {}

bool ModelDetector::initialize() {
  if (m_initialized) {
    return true;
  }

  try {
    m_net = cv::dnn::readNet(m_config.modelPath);
  } catch (const cv::Exception &e) {
    std::cerr << "Failed to load detector model " << m_config.modelPath
              << ": " << e.what() << std::endl;
    return false;
  }

  if (m_net.empty()) {
    std::cerr << "Detector model is empty: " << m_config.modelPath
              << std::endl;
    return false;
  }

  m_net.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
  m_net.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
  m_initialized = true;
  return true;
}

bool ModelDetector::isInitialized() const { return m_initialized; }

std::string ModelDetector::classNameFor(int classId) {
  switch (classId) {
  case 0:
    return "text";
  case 1:
    return "legend";
  case 2:
    return "scale_bar";
  case 3:
    return "grid_line";
  default:
    return "unknown";
  }
}

cv::Mat ModelDetector::toBgr(const cv::Mat &image) const {
  cv::Mat bgr;
  if (image.channels() == 1) {
    cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = image;
  }
  return bgr;
}

std::vector<DetectedObject> ModelDetector::detect(const cv::Mat &image) {
  if (!m_initialized) {
    throw std::runtime_error("Detector model not initialized");
  }
  if (image.empty()) {
    return {};
  }

  cv::Mat bgr = toBgr(image);
  cv::Mat blob = cv::dnn::blobFromImage(
      bgr, 1.0 / 255.0, cv::Size(m_config.inputSize, m_config.inputSize),
      cv::Scalar(), true, false);

  std::vector<cv::Mat> outputs;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_net.setInput(blob);
    m_net.forward(outputs, m_net.getUnconnectedOutLayersNames());
  }

  if (outputs.empty() || outputs[0].dims != 3) {
    throw std::runtime_error("Unexpected detector output shape");
  }

  // YOLOv8 emits [1, 4 + classes, anchors]; work on one anchor per row
  cv::Mat raw = outputs[0];
  int attributes = raw.size[1];
  int anchors = raw.size[2];
  cv::Mat rows = cv::Mat(attributes, anchors, CV_32F, raw.ptr<float>()).t();

  if (rows.cols <= 4) {
    throw std::runtime_error("Detector output has no class scores");
  }

  double xFactor = static_cast<double>(bgr.cols) / m_config.inputSize;
  double yFactor = static_cast<double>(bgr.rows) / m_config.inputSize;

  std::vector<cv::Rect> boxes;
  std::vector<float> scores;
  std::vector<int> classIds;

  for (int i = 0; i < rows.rows; i++) {
    const float *row = rows.ptr<float>(i);
    cv::Mat classScores(1, rows.cols - 4, CV_32F,
                        const_cast<float *>(row + 4));
    cv::Point classIdPoint;
    double maxScore;
    cv::minMaxLoc(classScores, nullptr, &maxScore, nullptr, &classIdPoint);

    if (maxScore < m_config.confThreshold) {
      continue;
    }

    float cx = row[0], cy = row[1], w = row[2], h = row[3];
    int left = static_cast<int>((cx - w / 2) * xFactor);
    int top = static_cast<int>((cy - h / 2) * yFactor);
    int width = static_cast<int>(w * xFactor);
    int height = static_cast<int>(h * yFactor);

    boxes.emplace_back(left, top, width, height);
    scores.push_back(static_cast<float>(maxScore));
    classIds.push_back(classIdPoint.x);
  }

  std::vector<int> indices;
  cv::dnn::NMSBoxes(boxes, scores, m_config.confThreshold,
                    m_config.nmsThreshold, indices);

  std::vector<DetectedObject> detections;
  cv::Rect frame(0, 0, bgr.cols, bgr.rows);
  for (int idx : indices) {
    cv::Rect clipped = boxes[idx] & frame;
    if (clipped.empty()) {
      continue;
    }

    DetectedObject object;
    object.bbox = BoundingBox::fromRect(clipped);
    object.className = classNameFor(classIds[idx]);
    object.confidence = scores[idx];
    detections.push_back(object);
  }

  return detections;
}

ShapeFallbackDetector::ShapeFallbackDetector(const DetectionConfig &config)
    : m_config(config) {}

std::string ShapeFallbackDetector::classifyVertexCount(size_t vertices) {
  if (vertices == 4) {
    return "rectangle_region";
  }
  if (vertices > 8) {
    return "circle_region";
  }
  return "polygon_region";
}

std::vector<DetectedObject>
ShapeFallbackDetector::detect(const cv::Mat &image) {
  std::vector<DetectedObject> detections;
  if (image.empty()) {
    return detections;
  }

  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);

  for (const auto &contour : contours) {
    cv::Rect boundingRect = cv::boundingRect(contour);
    if (boundingRect.area() < m_config.fallbackMinArea) {
      continue;
    }

    std::vector<cv::Point> approx;
    double epsilon = 0.02 * cv::arcLength(contour, true);
    cv::approxPolyDP(contour, approx, epsilon, true);

    DetectedObject object;
    object.bbox = BoundingBox::fromRect(boundingRect);
    object.className = classifyVertexCount(approx.size());
    object.confidence = m_config.fallbackConfidence;
    detections.push_back(object);
  }

  // findContours order is not spatial; report top-to-bottom, left-to-right
  std::stable_sort(detections.begin(), detections.end(),
                   [](const DetectedObject &a, const DetectedObject &b) {
                     if (a.bbox.y1 != b.bbox.y1) {
                       return a.bbox.y1 < b.bbox.y1;
                     }
                     return a.bbox.x1 < b.bbox.x1;
                   });

  return detections;
}

std::unique_ptr<Detector> makeDetector(const DetectionConfig &config) {
  std::error_code ec;
  if (!config.modelPath.empty() &&
      std::filesystem::is_regular_file(config.modelPath, ec)) {
    auto model = std::make_unique<ModelDetector>(config);
    if (model->initialize()) {
      return model;
    }
  } else {
    std::cerr << "Detector model not found at " << config.modelPath
              << ", using contour fallback" << std::endl;
  }

  return std::make_unique<ShapeFallbackDetector>(config);
}

DetectionStage::DetectionStage(std::unique_ptr<Detector> detector,
                               const DetectionConfig &config)
    : m_detector(std::move(detector)), m_fallback(config) {}

std::vector<DetectedObject> DetectionStage::run(const cv::Mat &image) {
  if (m_detector) {
    try {
      return m_detector->detect(image);
    } catch (const std::exception &e) {
      std::cerr << "Detector '" << m_detector->name()
                << "' failed, using contour fallback: " << e.what()
                << std::endl;
    }
  }

  try {
    return m_fallback.detect(image);
  } catch (const std::exception &e) {
    std::cerr << "Contour fallback failed: " << e.what() << std::endl;
    return {};
  }
}

} // namespace geomap
