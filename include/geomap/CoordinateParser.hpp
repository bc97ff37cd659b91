#ifndef GEOMAP_COORDINATE_PARSER_HPP
#define GEOMAP_COORDINATE_PARSER_HPP

#include "geomap/GeoTypes.hpp"

#include <optional>
#include <regex>
#include <string>

namespace geomap {

/**
 * @brief Parses OCR text fragments into coordinates
 *
 * Notations are tried from the most structurally specific to the most
 * generic so that a grid label such as "E 421500" is never read as a plain
 * number pair:
 * 1. Easting label   "E 421500"            (6 digits)
 * 2. Northing label  "N 4422150"           (7 digits)
 * 3. Decimal degrees "40.7128 N, 74.0060 W" or "-33.86, 151.21"
 * 4. DMS             "40°26'46\"N 79°58'56\"W"
 *
 * A fragment matching nothing is not an error; parse() returns nullopt.
 *
 * Example usage:
 * @code
 * geomap::CoordinateParser parser;
 * auto coord = parser.parse("40.7128 N, 74.0060 W", 0.9f);
 * if (coord) {
 *     std::cout << coord->lat << ", " << coord->lon << std::endl;
 * }
 * @endcode
 */
class CoordinateParser {
public:
  CoordinateParser();

  /**
   * @brief Parse a fragment under every supported notation
   * @param text Raw OCR text
   * @param confidence Recognition confidence copied into the result
   * @param placeholder Value stored in the unpaired axis of an
   * Easting-only/Northing-only result
   * @return Parsed coordinate, or nullopt if no notation matched
   */
  std::optional<Coordinate> parse(const std::string &text, float confidence,
                                  double placeholder = 0.0) const;

  /**
   * @brief Parse only the Easting/Northing grid label notations
   *
   * Used for margin labels, where decimal and DMS notations are not expected.
   */
  std::optional<Coordinate> parseGridLabel(const std::string &text,
                                           float confidence,
                                           double placeholder = 0.0) const;

  /**
   * @brief Upper-case, trim and replace degree/prime glyphs with ASCII
   *
   * Degree signs become 'd', primes become '\'', double primes become '"'.
   */
  static std::string normalize(const std::string &text);

private:
  std::optional<Coordinate> parseEasting(const std::string &normalized,
                                         const std::string &original,
                                         float confidence,
                                         double placeholder) const;
  std::optional<Coordinate> parseNorthing(const std::string &normalized,
                                          const std::string &original,
                                          float confidence,
                                          double placeholder) const;

  /**
   * @brief Decimal degrees; sets rejected when the match is out of range
   */
  std::optional<Coordinate> parseDecimal(const std::string &normalized,
                                         const std::string &original,
                                         float confidence,
                                         bool &rejected) const;
  std::optional<Coordinate> parseDms(const std::string &normalized,
                                     const std::string &original,
                                     float confidence) const;

  std::regex m_eastingPattern;
  std::regex m_northingPattern;
  std::regex m_decimalPattern;
  std::regex m_dmsPattern;
};

} // namespace geomap

#endif // GEOMAP_COORDINATE_PARSER_HPP
