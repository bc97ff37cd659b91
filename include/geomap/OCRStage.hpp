#ifndef GEOMAP_OCR_STAGE_HPP
#define GEOMAP_OCR_STAGE_HPP

#include "geomap/GeoTypes.hpp"
#include "geomap/PipelineConfig.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace geomap {

/**
 * @brief Text recognition capability
 *
 * Implementations may throw; OCRStage guards every call.
 */
class TextRecognizer {
public:
  virtual ~TextRecognizer() = default;

  /**
   * @brief Recognize text lines in an image
   * @return Fragments with image-space polygons and confidence in [0,1]
   */
  virtual std::vector<OcrFragment> readText(const cv::Mat &image) = 0;
};

/**
 * @brief Text recognizer backed by Tesseract
 *
 * Works at text-line level so that labels such as "E 421500" stay in one
 * fragment. Map margins often carry labels printed sideways, so when
 * OcrConfig::scanRotations is set the image is also read at 90, 180 and 270
 * degrees; boxes are mapped back to the original image and overlapping
 * duplicates (IoU > 0.5) keep the higher confidence.
 *
 * A single Tesseract engine is shared by all jobs; calls are serialized.
 *
 * Example usage:
 * @code
 * geomap::TesseractRecognizer recognizer(config.ocr);
 * if (recognizer.initialize()) {
 *     auto fragments = recognizer.readText(image);
 * }
 * @endcode
 */
class TesseractRecognizer : public TextRecognizer {
public:
  explicit TesseractRecognizer(const OcrConfig &config);
  ~TesseractRecognizer() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractRecognizer(const TesseractRecognizer &) = delete;
  TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  std::vector<OcrFragment> readText(const cv::Mat &image) override;

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

private:
  /**
   * @brief Convert OpenCV Mat to Tesseract-compatible format
   */
  void setImage(const cv::Mat &image);

  /**
   * @brief Read text lines of an image rotated by rotationCode
   * @param rotationCode -1 for no rotation, or a cv::ROTATE_* constant
   */
  void readRotation(const cv::Mat &image, int rotationCode,
                    std::vector<OcrFragment> &fragments);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;    ///< Tesseract API instance
  OcrConfig m_config; ///< Current configuration
  bool m_initialized; ///< Initialization state
  std::mutex m_mutex;
};

/**
 * @brief Runs OCR on an optionally pre-processed image
 *
 * Recognizer failures are logged and produce an empty result: images without
 * coordinate text are common and not an error.
 */
class OCRStage {
public:
  OCRStage(std::unique_ptr<TextRecognizer> recognizer, const OcrConfig &config);

  std::vector<OcrFragment> run(const cv::Mat &image);

  /**
   * @brief Grayscale, Gaussian denoise and adaptive threshold
   */
  static cv::Mat preprocessImage(const cv::Mat &image);

private:
  std::unique_ptr<TextRecognizer> m_recognizer;
  OcrConfig m_config;
};

} // namespace geomap

#endif // GEOMAP_OCR_STAGE_HPP
