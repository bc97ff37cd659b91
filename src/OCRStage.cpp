#include "geomap/OCRStage.hpp"

#include <opencv2/imgproc.hpp>
#include <tesseract/resultiterator.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace geomap {

namespace {

cv::Rect boundingRectOf(const std::vector<cv::Point> &polygon) {
  return cv::boundingRect(polygon);
}

std::vector<cv::Point> polygonOf(const cv::Rect &box) {
  return {box.tl(), cv::Point(box.x + box.width, box.y), box.br(),
          cv::Point(box.x, box.y + box.height)};
}

std::string trimmed(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r");
  size_t end = text.find_last_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return "";
  }
  return text.substr(start, end - start + 1);
}

} // namespace

TesseractRecognizer::TesseractRecognizer(const OcrConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractRecognizer::~TesseractRecognizer() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractRecognizer::initialize() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_initialized) {
    return true;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable, otherwise let
  // Tesseract use its compiled-in default
  else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
    if (tessDataPath == nullptr) {
      std::cerr << "TESSDATA_PREFIX not set, using Tesseract default"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool TesseractRecognizer::isInitialized() const { return m_initialized; }

std::string TesseractRecognizer::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

void TesseractRecognizer::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels, rgbImage may go out of scope afterwards
  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

void TesseractRecognizer::readRotation(const cv::Mat &image, int rotationCode,
                                       std::vector<OcrFragment> &fragments) {
  cv::Mat rotatedImage;
  if (rotationCode == -1) {
    rotatedImage = image;
  } else {
    cv::rotate(image, rotatedImage, rotationCode);
  }

  setImage(rotatedImage);
  if (m_tesseract->Recognize(nullptr) != 0) {
    std::cerr << "DEBUG: Tesseract recognition failed for rotation "
              << rotationCode << std::endl;
    return;
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  if (!ri) {
    return;
  }

  tesseract::PageIteratorLevel level = tesseract::RIL_TEXTLINE;
  cv::Rect frame(0, 0, image.cols, image.rows);

  do {
    std::unique_ptr<char[]> text(ri->GetUTF8Text(level));
    if (!text || *text.get() == '\0') {
      continue;
    }

    std::string line = trimmed(text.get());
    if (line.empty()) {
      continue;
    }

    int x1, y1, x2, y2;
    if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
      continue;
    }
    cv::Rect box(x1, y1, x2 - x1, y2 - y1);

    // Reverse the rotation to get coordinates in original image space
    cv::Rect original;
    switch (rotationCode) {
    case cv::ROTATE_90_CLOCKWISE:
      // (x, y) in rotated -> (y, height - x - w) in original
      original = cv::Rect(box.y, image.rows - box.x - box.width, box.height,
                          box.width);
      break;
    case cv::ROTATE_180:
      original = cv::Rect(image.cols - box.x - box.width,
                          image.rows - box.y - box.height, box.width,
                          box.height);
      break;
    case cv::ROTATE_90_COUNTERCLOCKWISE:
      // (x, y) in rotated -> (width - y - h, x) in original
      original = cv::Rect(image.cols - box.y - box.height, box.x, box.height,
                          box.width);
      break;
    default:
      original = box;
      break;
    }

    original &= frame;
    if (original.empty()) {
      continue;
    }

    OcrFragment fragment;
    fragment.text = line;
    fragment.polygon = polygonOf(original);
    // Tesseract reports 0-100
    fragment.confidence = ri->Confidence(level) / 100.0f;
    fragments.push_back(fragment);
  } while (ri->Next(level));
}

std::vector<OcrFragment> TesseractRecognizer::readText(const cv::Mat &image) {
  std::lock_guard<std::mutex> lock(m_mutex);

  if (!m_initialized) {
    throw std::runtime_error(
        "OCR engine not initialized. Call initialize() first.");
  }

  std::vector<OcrFragment> allFragments;
  if (image.empty()) {
    return allFragments;
  }

  std::vector<int> rotations = {-1};
  if (m_config.scanRotations) {
    rotations = {-1, cv::ROTATE_90_CLOCKWISE, cv::ROTATE_180,
                 cv::ROTATE_90_COUNTERCLOCKWISE};
  }

  for (int rotationCode : rotations) {
    readRotation(image, rotationCode, allFragments);
  }

  // Remove duplicate/overlapping fragments (keep highest confidence)
  std::vector<OcrFragment> filtered;
  for (const auto &fragment : allFragments) {
    cv::Rect box = boundingRectOf(fragment.polygon);
    bool isDuplicate = false;
    for (auto &existing : filtered) {
      cv::Rect existingBox = boundingRectOf(existing.polygon);
      cv::Rect intersection = box & existingBox;
      if (intersection.empty()) {
        continue;
      }

      double intersectionArea = intersection.area();
      double unionArea = box.area() + existingBox.area() - intersectionArea;
      if (unionArea > 0 && intersectionArea / unionArea > 0.5) {
        isDuplicate = true;
        if (fragment.confidence > existing.confidence) {
          existing = fragment;
        }
        break;
      }
    }
    if (!isDuplicate) {
      filtered.push_back(fragment);
    }
  }

  return filtered;
}

OCRStage::OCRStage(std::unique_ptr<TextRecognizer> recognizer,
                   const OcrConfig &config)
    : m_recognizer(std::move(recognizer)), m_config(config) {}

cv::Mat OCRStage::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

std::vector<OcrFragment> OCRStage::run(const cv::Mat &image) {
  if (!m_recognizer || image.empty()) {
    return {};
  }

  try {
    cv::Mat input = m_config.preprocessImage ? preprocessImage(image) : image;
    return m_recognizer->readText(input);
  } catch (const std::exception &e) {
    std::cerr << "OCR failed, continuing without text: " << e.what()
              << std::endl;
    return {};
  }
}

} // namespace geomap
