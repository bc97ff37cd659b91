#include "geomap/ResultSerializer.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <stdexcept>

namespace geomap {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value stringValue(const std::string &text, Allocator &allocator) {
  return rapidjson::Value(text.c_str(),
                          static_cast<rapidjson::SizeType>(text.size()),
                          allocator);
}

rapidjson::Value encodeBox(const BoundingBox &box, Allocator &allocator) {
  rapidjson::Value array(rapidjson::kArrayType);
  array.PushBack(box.x1, allocator);
  array.PushBack(box.y1, allocator);
  array.PushBack(box.x2, allocator);
  array.PushBack(box.y2, allocator);
  return array;
}

rapidjson::Value encodeObject(const DetectedObject &object,
                              Allocator &allocator) {
  rapidjson::Value value(rapidjson::kObjectType);
  value.AddMember("bbox", encodeBox(object.bbox, allocator), allocator);
  value.AddMember("class_name", stringValue(object.className, allocator),
                  allocator);
  value.AddMember("confidence", static_cast<double>(object.confidence),
                  allocator);
  return value;
}

rapidjson::Value encodeCoordinate(const Coordinate &coord,
                                  Allocator &allocator) {
  rapidjson::Value value(rapidjson::kObjectType);
  value.AddMember("kind", stringValue(toString(coord.kind), allocator),
                  allocator);
  value.AddMember("lat", coord.lat, allocator);
  value.AddMember("lon", coord.lon, allocator);
  value.AddMember("confidence", static_cast<double>(coord.confidence),
                  allocator);
  value.AddMember("text", stringValue(coord.text, allocator), allocator);
  if (coord.anchored) {
    rapidjson::Value anchor(rapidjson::kObjectType);
    anchor.AddMember("lat", coord.anchorLat, allocator);
    anchor.AddMember("lon", coord.anchorLon, allocator);
    value.AddMember("anchor", anchor, allocator);
  }
  return value;
}

rapidjson::Value encodeResult(const ProcessingResultData &result,
                              Allocator &allocator) {
  rapidjson::Value value(rapidjson::kObjectType);

  rapidjson::Value objects(rapidjson::kArrayType);
  for (const auto &object : result.detectedObjects) {
    objects.PushBack(encodeObject(object, allocator), allocator);
  }
  value.AddMember("detected_objects", objects, allocator);

  rapidjson::Value coordinates(rapidjson::kArrayType);
  for (const auto &coord : result.coordinates) {
    coordinates.PushBack(encodeCoordinate(coord, allocator), allocator);
  }
  value.AddMember("coordinates", coordinates, allocator);

  rapidjson::Value regions(rapidjson::kArrayType);
  for (const auto &region : result.regions) {
    rapidjson::Value regionValue(rapidjson::kObjectType);
    rapidjson::Value members(rapidjson::kArrayType);
    for (const auto &coord : region.coordinates) {
      members.PushBack(encodeCoordinate(coord, allocator), allocator);
    }
    regionValue.AddMember("coordinates", members, allocator);
    regionValue.AddMember("segment_path",
                          stringValue(region.segmentPath, allocator),
                          allocator);
    regionValue.AddMember("bbox", encodeBox(region.bbox, allocator),
                          allocator);
    regions.PushBack(regionValue, allocator);
  }
  value.AddMember("regions", regions, allocator);

  return value;
}

const rapidjson::Value &member(const rapidjson::Value &object,
                               const char *name) {
  if (!object.IsObject()) {
    throw std::runtime_error(std::string("expected object holding '") + name +
                             "'");
  }
  auto it = object.FindMember(name);
  if (it == object.MemberEnd()) {
    throw std::runtime_error(std::string("missing field '") + name + "'");
  }
  return it->value;
}

double readNumber(const rapidjson::Value &object, const char *name) {
  const rapidjson::Value &value = member(object, name);
  if (!value.IsNumber()) {
    throw std::runtime_error(std::string("field '") + name +
                             "' is not a number");
  }
  return value.GetDouble();
}

std::string readString(const rapidjson::Value &object, const char *name) {
  const rapidjson::Value &value = member(object, name);
  if (!value.IsString()) {
    throw std::runtime_error(std::string("field '") + name +
                             "' is not a string");
  }
  return std::string(value.GetString(), value.GetStringLength());
}

const rapidjson::Value &readArray(const rapidjson::Value &object,
                                  const char *name) {
  const rapidjson::Value &value = member(object, name);
  if (!value.IsArray()) {
    throw std::runtime_error(std::string("field '") + name +
                             "' is not an array");
  }
  return value;
}

BoundingBox decodeBox(const rapidjson::Value &object) {
  const rapidjson::Value &array = readArray(object, "bbox");
  if (array.Size() != 4) {
    throw std::runtime_error("bbox must have 4 elements");
  }
  for (const auto &v : array.GetArray()) {
    if (!v.IsInt()) {
      throw std::runtime_error("bbox elements must be integers");
    }
  }
  return {array[0u].GetInt(), array[1u].GetInt(), array[2u].GetInt(),
          array[3u].GetInt()};
}

Coordinate decodeCoordinate(const rapidjson::Value &object) {
  Coordinate coord;
  auto kind = coordinateKindFromString(readString(object, "kind"));
  if (!kind) {
    throw std::runtime_error("unknown coordinate kind");
  }
  coord.kind = *kind;
  coord.lat = readNumber(object, "lat");
  coord.lon = readNumber(object, "lon");
  coord.confidence = static_cast<float>(readNumber(object, "confidence"));
  coord.text = readString(object, "text");

  auto anchor = object.FindMember("anchor");
  if (anchor != object.MemberEnd()) {
    coord.anchored = true;
    coord.anchorLat = readNumber(anchor->value, "lat");
    coord.anchorLon = readNumber(anchor->value, "lon");
  }
  return coord;
}

ProcessingResultData decodeResult(const rapidjson::Value &object) {
  ProcessingResultData result;

  for (const auto &value : readArray(object, "detected_objects").GetArray()) {
    DetectedObject detected;
    detected.bbox = decodeBox(value);
    detected.className = readString(value, "class_name");
    detected.confidence = static_cast<float>(readNumber(value, "confidence"));
    result.detectedObjects.push_back(detected);
  }

  for (const auto &value : readArray(object, "coordinates").GetArray()) {
    result.coordinates.push_back(decodeCoordinate(value));
  }

  for (const auto &value : readArray(object, "regions").GetArray()) {
    RegionOfInterest region;
    for (const auto &coord : readArray(value, "coordinates").GetArray()) {
      region.coordinates.push_back(decodeCoordinate(coord));
    }
    region.segmentPath = readString(value, "segment_path");
    region.bbox = decodeBox(value);
    result.regions.push_back(region);
  }

  return result;
}

template <typename Writer>
std::string write(const rapidjson::Value &value) {
  rapidjson::StringBuffer buffer;
  Writer writer(buffer);
  if (!value.Accept(writer)) {
    throw std::runtime_error("JSON encoding failed: non-finite number");
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

std::string ResultSerializer::toJson(const ProcessingResultData &result) {
  rapidjson::Document document;
  document.SetObject();
  rapidjson::Value value = encodeResult(result, document.GetAllocator());
  return write<rapidjson::Writer<rapidjson::StringBuffer>>(value);
}

std::optional<ProcessingResultData>
ResultSerializer::fromJson(const std::string &json,
                           std::string *errorMessage) {
  rapidjson::Document document;
  document.Parse<rapidjson::kParseFullPrecisionFlag>(json.c_str(),
                                                     json.size());
  if (document.HasParseError()) {
    if (errorMessage) {
      *errorMessage = std::string("JSON parse error: ") +
                      rapidjson::GetParseError_En(document.GetParseError()) +
                      " at offset " +
                      std::to_string(document.GetErrorOffset());
    }
    return std::nullopt;
  }

  try {
    return decodeResult(document);
  } catch (const std::runtime_error &e) {
    if (errorMessage) {
      *errorMessage = std::string("Invalid result: ") + e.what();
    }
    return std::nullopt;
  }
}

std::string ResultSerializer::toJson(const JobStatus &status, bool pretty) {
  rapidjson::Document document;
  document.SetObject();
  Allocator &allocator = document.GetAllocator();

  document.AddMember("job_id", stringValue(status.jobId, allocator),
                     allocator);
  document.AddMember("status", stringValue(toString(status.state), allocator),
                     allocator);
  document.AddMember("message", stringValue(status.message, allocator),
                     allocator);
  document.AddMember("image_path", stringValue(status.imagePath, allocator),
                     allocator);
  document.AddMember("original_filename",
                     stringValue(status.originalFilename, allocator),
                     allocator);
  document.AddMember("file_size", static_cast<uint64_t>(status.fileSize),
                     allocator);
  document.AddMember("created_at", stringValue(status.createdAt, allocator),
                     allocator);
  document.AddMember("updated_at", stringValue(status.updatedAt, allocator),
                     allocator);

  if (status.result) {
    document.AddMember("result", encodeResult(*status.result, allocator),
                       allocator);
  } else {
    document.AddMember("result", rapidjson::Value(rapidjson::kNullType),
                       allocator);
  }

  if (status.errorInfo) {
    document.AddMember("error_info", stringValue(*status.errorInfo, allocator),
                       allocator);
  } else {
    document.AddMember("error_info", rapidjson::Value(rapidjson::kNullType),
                       allocator);
  }

  if (pretty) {
    return write<rapidjson::PrettyWriter<rapidjson::StringBuffer>>(document);
  }
  return write<rapidjson::Writer<rapidjson::StringBuffer>>(document);
}

} // namespace geomap
