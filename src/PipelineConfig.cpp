#include "geomap/PipelineConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace geomap {

namespace {

bool readPositiveInt(const char *name, int &target) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return false;
  }

  try {
    int parsed = std::stoi(value);
    if (parsed <= 0) {
      std::cerr << "Ignoring " << name << "=" << value
                << ": value must be positive" << std::endl;
      return false;
    }
    target = parsed;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "Ignoring " << name << "=" << value << ": " << e.what()
              << std::endl;
    return false;
  }
}

} // namespace

PipelineConfig PipelineConfig::fromEnvironment() {
  PipelineConfig config;

  if (const char *dir = std::getenv("GEOMAP_ARTIFACT_DIR")) {
    if (*dir != '\0') {
      config.artifactDir = dir;
    }
  }

  if (const char *model = std::getenv("GEOMAP_MODEL_PATH")) {
    if (*model != '\0') {
      config.detection.modelPath = model;
    }
  }

  if (const char *tessData = std::getenv("TESSDATA_PREFIX")) {
    config.ocr.tessDataPath = tessData;
  }

  readPositiveInt("GEOMAP_WORKERS", config.workerThreads);
  readPositiveInt("GEOMAP_CACHE_TTL", config.cacheTtlSeconds);

  return config;
}

} // namespace geomap
