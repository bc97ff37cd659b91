#include "geomap/CoordinateParser.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace geomap {

namespace {

void replaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool isLatitudeLetter(char c) { return c == 'N' || c == 'S'; }
bool isLongitudeLetter(char c) { return c == 'E' || c == 'W'; }

char letterOf(const std::ssub_match &first, const std::ssub_match &second) {
  if (first.matched) {
    return first.str()[0];
  }
  if (second.matched) {
    return second.str()[0];
  }
  return '\0';
}

// A hemisphere letter fixes the sign; without one the numeric sign stands.
double applyHemisphere(double value, char letter) {
  if (letter == 'S' || letter == 'W') {
    return -std::fabs(value);
  }
  if (letter == 'N' || letter == 'E') {
    return std::fabs(value);
  }
  return value;
}

} // namespace

CoordinateParser::CoordinateParser()
    : m_eastingPattern(R"((?:^|[^A-Z0-9])E\s*[:=]?\s*(\d{6})(?![\d.]))"),
      m_northingPattern(R"((?:^|[^A-Z0-9])N\s*[:=]?\s*(\d{7})(?![\d.]))"),
      m_decimalPattern(
          R"(([NSEW])?\s*([+-]?\d+\.\d+)\s*d?\s*([NSEW])?\s*[,;/]?\s*)"
          R"(([NSEW])?\s*([+-]?\d+\.\d+)\s*d?\s*([NSEW])?)"),
      m_dmsPattern(
          R"((\d{1,3})\s*d\s*(\d{1,2}(?:\.\d+)?)\s*'\s*(?:(\d{1,2}(?:\.\d+)?)\s*"?)?\s*([NS]))"
          R"([\s,;/]*)"
          R"((\d{1,3})\s*d\s*(\d{1,2}(?:\.\d+)?)\s*'\s*(?:(\d{1,2}(?:\.\d+)?)\s*"?)?\s*([EW]))") {
}

std::string CoordinateParser::normalize(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r");
  size_t end = text.find_last_not_of(" \t\n\r");
  if (start == std::string::npos) {
    return "";
  }

  std::string result = text.substr(start, end - start + 1);
  for (char &c : result) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 128) {
      c = static_cast<char>(std::toupper(uc));
    }
  }

  // Degree sign, masculine ordinal and ring above are all read as degrees
  replaceAll(result, "\xC2\xB0", "d");
  replaceAll(result, "\xC2\xBA", "d");
  replaceAll(result, "\xCB\x9A", "d");
  // Prime and curly quotes
  replaceAll(result, "\xE2\x80\xB2", "'");
  replaceAll(result, "\xE2\x80\x99", "'");
  replaceAll(result, "\xE2\x80\xB3", "\"");
  replaceAll(result, "\xE2\x80\x9C", "\"");
  replaceAll(result, "\xE2\x80\x9D", "\"");
  replaceAll(result, "''", "\"");

  return result;
}

std::optional<Coordinate> CoordinateParser::parse(const std::string &text,
                                                  float confidence,
                                                  double placeholder) const {
  std::string normalized = normalize(text);
  if (normalized.empty()) {
    return std::nullopt;
  }

  if (auto coord = parseEasting(normalized, text, confidence, placeholder)) {
    return coord;
  }
  if (auto coord = parseNorthing(normalized, text, confidence, placeholder)) {
    return coord;
  }

  bool rejected = false;
  if (auto coord = parseDecimal(normalized, text, confidence, rejected)) {
    return coord;
  }
  if (rejected) {
    return std::nullopt;
  }

  return parseDms(normalized, text, confidence);
}

std::optional<Coordinate>
CoordinateParser::parseGridLabel(const std::string &text, float confidence,
                                 double placeholder) const {
  std::string normalized = normalize(text);
  if (normalized.empty()) {
    return std::nullopt;
  }

  if (auto coord = parseEasting(normalized, text, confidence, placeholder)) {
    return coord;
  }
  return parseNorthing(normalized, text, confidence, placeholder);
}

std::optional<Coordinate>
CoordinateParser::parseEasting(const std::string &normalized,
                               const std::string &original, float confidence,
                               double placeholder) const {
  std::smatch match;
  if (!std::regex_search(normalized, match, m_eastingPattern)) {
    return std::nullopt;
  }

  try {
    Coordinate coord;
    coord.kind = CoordinateKind::EastingOnly;
    coord.lon = std::stod(match[1].str());
    coord.lat = placeholder;
    coord.confidence = confidence;
    coord.text = original;
    return coord;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<Coordinate>
CoordinateParser::parseNorthing(const std::string &normalized,
                                const std::string &original, float confidence,
                                double placeholder) const {
  std::smatch match;
  if (!std::regex_search(normalized, match, m_northingPattern)) {
    return std::nullopt;
  }

  try {
    Coordinate coord;
    coord.kind = CoordinateKind::NorthingOnly;
    coord.lat = std::stod(match[1].str());
    coord.lon = placeholder;
    coord.confidence = confidence;
    coord.text = original;
    return coord;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<Coordinate>
CoordinateParser::parseDecimal(const std::string &normalized,
                               const std::string &original, float confidence,
                               bool &rejected) const {
  rejected = false;

  std::smatch match;
  if (!std::regex_search(normalized, match, m_decimalPattern)) {
    return std::nullopt;
  }

  double first = 0.0;
  double second = 0.0;
  try {
    first = std::stod(match[2].str());
    second = std::stod(match[5].str());
  } catch (const std::exception &) {
    return std::nullopt;
  }

  char firstLetter = letterOf(match[1], match[3]);
  char secondLetter = letterOf(match[4], match[6]);

  // "74.0060 W, 40.7128 N": longitude written first
  bool lonFirst = (isLongitudeLetter(firstLetter) ||
                   isLatitudeLetter(secondLetter)) &&
                  !isLatitudeLetter(firstLetter) &&
                  !isLongitudeLetter(secondLetter);
  if (lonFirst) {
    std::swap(first, second);
    std::swap(firstLetter, secondLetter);
  }

  if ((firstLetter != '\0' && !isLatitudeLetter(firstLetter)) ||
      (secondLetter != '\0' && !isLongitudeLetter(secondLetter))) {
    return std::nullopt;
  }

  double lat = applyHemisphere(first, firstLetter);
  double lon = applyHemisphere(second, secondLetter);

  if (std::fabs(lat) > 90.0 || std::fabs(lon) > 180.0) {
    rejected = true;
    return std::nullopt;
  }

  Coordinate coord;
  coord.kind = CoordinateKind::Paired;
  coord.lat = lat;
  coord.lon = lon;
  coord.confidence = confidence;
  coord.text = original;
  return coord;
}

std::optional<Coordinate>
CoordinateParser::parseDms(const std::string &normalized,
                           const std::string &original,
                           float confidence) const {
  std::smatch match;
  if (!std::regex_search(normalized, match, m_dmsPattern)) {
    return std::nullopt;
  }

  double lat = 0.0;
  double lon = 0.0;
  try {
    lat = std::stod(match[1].str()) + std::stod(match[2].str()) / 60.0;
    if (match[3].matched) {
      lat += std::stod(match[3].str()) / 3600.0;
    }
    lon = std::stod(match[5].str()) + std::stod(match[6].str()) / 60.0;
    if (match[7].matched) {
      lon += std::stod(match[7].str()) / 3600.0;
    }
  } catch (const std::exception &) {
    return std::nullopt;
  }

  lat = applyHemisphere(lat, match[4].str()[0]);
  lon = applyHemisphere(lon, match[8].str()[0]);

  if (std::fabs(lat) > 90.0 || std::fabs(lon) > 180.0) {
    return std::nullopt;
  }

  Coordinate coord;
  coord.kind = CoordinateKind::Paired;
  coord.lat = lat;
  coord.lon = lon;
  coord.confidence = confidence;
  coord.text = original;
  return coord;
}

} // namespace geomap
