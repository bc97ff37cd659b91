#include "geomap/MapPipeline.hpp"
#include "geomap/ResultSerializer.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <image_path>... [options]\n"
      << "\nOptions:\n"
      << "  -m, --model <path>      Detector ONNX model "
         "(default: models/yolov8n.onnx)\n"
      << "  -o, --output <dir>      Directory for segment images "
         "(default: uploads)\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -w, --workers <n>       Number of worker threads (default: 2)\n"
      << "  -p, --pretty            Indent JSON output\n"
      << "      --no-cache          Do not cache completed results\n"
      << "      --no-preprocess     Run OCR on the unprocessed image\n"
      << "      --segments          Print the path of every segment written\n"
      << "  -h, --help              Show this help message\n"
      << "\nEnvironment:\n"
      << "  GEOMAP_ARTIFACT_DIR, GEOMAP_MODEL_PATH, TESSDATA_PREFIX,\n"
      << "  GEOMAP_WORKERS, GEOMAP_CACHE_TTL\n"
      << "\nExamples:\n"
      << "  " << programName << " map.png\n"
      << "  " << programName << " north.png south.png -w 4 -o segments\n"
      << "  " << programName << " map.png --segments -p\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> imagePaths;
  geomap::PipelineConfig config = geomap::PipelineConfig::fromEnvironment();
  bool pretty = false;
  bool showSegments = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-m" || arg == "--model") {
      if (i + 1 < argc) {
        config.detection.modelPath = argv[++i];
      } else {
        std::cerr << "Error: --model requires an argument\n";
        return 1;
      }
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        config.artifactDir = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg == "-l" || arg == "--language") {
      if (i + 1 < argc) {
        config.ocr.language = argv[++i];
      } else {
        std::cerr << "Error: --language requires an argument\n";
        return 1;
      }
    } else if (arg == "-w" || arg == "--workers") {
      if (i + 1 < argc) {
        try {
          config.workerThreads = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --workers expects a number\n";
          return 1;
        }
        if (config.workerThreads <= 0) {
          std::cerr << "Error: --workers must be positive\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --workers requires an argument\n";
        return 1;
      }
    } else if (arg == "-p" || arg == "--pretty") {
      pretty = true;
    } else if (arg == "--no-cache") {
      config.enableCache = false;
    } else if (arg == "--no-preprocess") {
      config.ocr.preprocessImage = false;
    } else if (arg == "--segments") {
      showSegments = true;
    } else if (arg[0] != '-') {
      imagePaths.push_back(arg);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (imagePaths.empty()) {
    std::cerr << "Error: No image path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Display version info
  std::cerr << "=== GeoMap Analysis ===\n"
            << "Tesseract version: "
            << geomap::TesseractRecognizer::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << config.ocr.language << "\n"
            << "Workers: " << config.workerThreads << "\n"
            << "=======================\n";

  auto recognizer = std::make_unique<geomap::TesseractRecognizer>(config.ocr);
  std::unique_ptr<geomap::TextRecognizer> textRecognizer;
  if (recognizer->initialize()) {
    textRecognizer = std::move(recognizer);
  } else {
    std::cerr << "Failed to initialize OCR engine, continuing without text.\n"
              << "Make sure Tesseract is installed and tessdata is "
                 "available.\n";
  }

  std::vector<geomap::JobStatus> statuses;
  try {
    geomap::MapPipeline pipeline(
        config, geomap::makeDetector(config.detection),
        std::move(textRecognizer),
        std::make_shared<geomap::InMemoryJobStore>(),
        std::make_shared<geomap::InMemoryResultCache>());

    std::vector<geomap::SubmittedJob> jobs;
    for (const auto &path : imagePaths) {
      jobs.push_back(pipeline.submit(path));
    }

    for (auto &job : jobs) {
      geomap::JobStatus status = job.completion.get();
      std::cout << geomap::ResultSerializer::toJson(status, pretty) << "\n";

      if (showSegments && status.result) {
        for (const auto &region : status.result->regions) {
          auto path = pipeline.segmentPath(status.jobId, region.segmentPath);
          if (path) {
            std::cerr << status.jobId << "  " << path->string() << "\n";
          } else {
            std::cerr << status.jobId << "  " << region.segmentPath
                      << " (not available)\n";
          }
        }
      }
      statuses.push_back(status);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  size_t failed = 0;
  for (const auto &status : statuses) {
    if (status.state == geomap::JobState::Failed) {
      failed++;
    }
  }
  std::cerr << "\nJobs completed: " << statuses.size() - failed
            << ", failed: " << failed << "\n";

  return failed == 0 ? 0 : 2;
}
