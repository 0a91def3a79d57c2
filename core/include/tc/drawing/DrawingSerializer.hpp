#pragma once
#include "tc/drawing/DrawingStore.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tc {

inline constexpr const char* kExportVersion = "2.0";

// Writer that tolerates NaN/Infinity so a damaged object still round-trips
// into the import path, where it is repaired.
using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                     rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

void writeDrawingObject(JsonWriter& w, const DrawingObject& obj);

// Structural parse of one wire object. Points are read as-is (non-numeric
// coordinates become NaN); the caller repairs them and checks point counts.
// Returns false with a reason when the element cannot be a drawing.
bool readDrawingObject(const rapidjson::Value& v, DrawingObject& out, std::string& error);

// {version, timestamp, objects:[...]}
std::string writeDrawingDocument(const ObjectList& objects, std::int64_t timestampMs);

struct DrawingDocument {
  std::string version;
  std::int64_t timestampMs{0};
  std::vector<DrawingObject> objects;
  std::vector<std::string> skipped;   // one reason per dropped element
};

// False (and `out` untouched) unless the text parses to an object whose
// `objects` member is an array.
bool parseDrawingDocument(const std::string& json, DrawingDocument& out);

} // namespace tc
