#ifndef GEOMAP_RESULT_SERIALIZER_HPP
#define GEOMAP_RESULT_SERIALIZER_HPP

#include "geomap/GeoTypes.hpp"

#include <optional>
#include <string>

namespace geomap {

/**
 * @brief JSON encoding of job results and job status
 *
 * Field names follow the public result schema (detected_objects,
 * coordinates, regions, bbox as [x1, y1, x2, y2], ...). Doubles are parsed
 * with full precision so that a serialized result reads back field-equal.
 */
class ResultSerializer {
public:
  /// Throws std::runtime_error when a number is NaN or infinite
  static std::string toJson(const ProcessingResultData &result);

  /**
   * @brief Decode a result
   * @param json Serialized result
   * @param errorMessage Optional destination for the reason of a failure
   * @return Decoded result, or nullopt if json is malformed or incomplete
   */
  static std::optional<ProcessingResultData>
  fromJson(const std::string &json, std::string *errorMessage = nullptr);

  /**
   * @brief Encode a job status, including its result when present
   * @param pretty Indent the output for humans
   */
  static std::string toJson(const JobStatus &status, bool pretty = false);
};

} // namespace geomap

#endif // GEOMAP_RESULT_SERIALIZER_HPP
