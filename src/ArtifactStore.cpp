#include "geomap/ArtifactStore.hpp"

#include <system_error>

namespace geomap {

ArtifactStore::ArtifactStore(const std::filesystem::path &directory)
    : m_directory(directory) {
  std::filesystem::create_directories(m_directory);
}

bool ArtifactStore::isSafeFilename(const std::string &filename) {
  if (filename.empty()) {
    return false;
  }
  return filename.find("..") == std::string::npos &&
         filename.find('/') == std::string::npos &&
         filename.find('\\') == std::string::npos;
}

std::optional<std::filesystem::path>
ArtifactStore::pathFor(const std::string &filename) const {
  if (!isSafeFilename(filename)) {
    return std::nullopt;
  }
  return m_directory / filename;
}

std::optional<std::filesystem::path>
ArtifactStore::locate(const std::string &filename) const {
  auto path = pathFor(filename);
  if (!path) {
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*path, ec)) {
    return std::nullopt;
  }
  return path;
}

} // namespace geomap
