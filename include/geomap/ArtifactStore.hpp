#ifndef GEOMAP_ARTIFACT_STORE_HPP
#define GEOMAP_ARTIFACT_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace geomap {

/**
 * @brief Shared directory holding segment images, addressed by filename
 */
class ArtifactStore {
public:
  /**
   * @brief Use (and create if needed) the given directory
   * @throws std::filesystem::filesystem_error if the directory cannot be made
   */
  explicit ArtifactStore(const std::filesystem::path &directory);

  const std::filesystem::path &directory() const { return m_directory; }

  /**
   * @brief Reject names that could escape the artifact directory
   * @return false for empty names, names containing "..", '/' or '\\'
   */
  static bool isSafeFilename(const std::string &filename);

  /**
   * @brief Full path of an artifact
   * @return nullopt if the filename is unsafe
   */
  std::optional<std::filesystem::path>
  pathFor(const std::string &filename) const;

  /**
   * @brief Full path of an existing artifact
   * @return nullopt if the filename is unsafe or no such file exists
   */
  std::optional<std::filesystem::path>
  locate(const std::string &filename) const;

private:
  std::filesystem::path m_directory;
};

} // namespace geomap

#endif // GEOMAP_ARTIFACT_STORE_HPP
