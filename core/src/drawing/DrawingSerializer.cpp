#include "tc/drawing/DrawingSerializer.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace tc {

// Non-finite keeps the fallback; anything else saturates to T's range.
template <typename T>
static T clampedInteger(double v, T fallback) {
  if (!std::isfinite(v)) return fallback;
  const double lo = static_cast<double>(std::numeric_limits<T>::min());
  const double hi = static_cast<double>(std::numeric_limits<T>::max());
  if (v <= lo) return std::numeric_limits<T>::min();
  if (v >= hi) return std::numeric_limits<T>::max();
  return static_cast<T>(v);
}

static void writeStyle(JsonWriter& w, const DrawingStyle& s) {
  w.StartObject();
  w.Key("color");      w.String(s.color.c_str());
  w.Key("lineWidth");  w.Double(s.lineWidth);
  w.Key("lineStyle");  w.String(lineStyleName(s.lineStyle));
  if (!s.fillColor.empty()) {
    w.Key("fillColor"); w.String(s.fillColor.c_str());
  }
  w.Key("opacity");    w.Double(s.opacity);
  w.Key("fontSize");   w.Double(s.fontSize);
  w.Key("fontFamily"); w.String(s.fontFamily.c_str());
  w.Key("fontWeight"); w.String(s.fontWeight.c_str());
  w.EndObject();
}

static void writeMeta(JsonWriter& w, const MetaBag& meta) {
  w.StartObject();
  for (const auto& kv : meta) {
    w.Key(kv.first.c_str());
    const MetaValue& m = kv.second;
    switch (m.kind) {
      case MetaValue::Kind::Number: w.Double(m.number); break;
      case MetaValue::Kind::Text:   w.String(m.text.c_str()); break;
      case MetaValue::Kind::Flag:   w.Bool(m.flag); break;
      case MetaValue::Kind::NumberList:
        w.StartArray();
        for (double v : m.numbers) w.Double(v);
        w.EndArray();
        break;
    }
  }
  w.EndObject();
}

void writeDrawingObject(JsonWriter& w, const DrawingObject& obj) {
  w.StartObject();
  w.Key("id");     w.String(obj.id.c_str());
  w.Key("type");   w.String(drawingTypeId(obj.type));
  w.Key("paneId"); w.String(paneIdName(obj.paneId));
  w.Key("points");
  w.StartArray();
  for (const auto& p : obj.points) {
    w.StartObject();
    w.Key("t"); w.Double(p.t);
    w.Key("p"); w.Double(p.p);
    w.EndObject();
  }
  w.EndArray();
  w.Key("style");   writeStyle(w, obj.style);
  w.Key("locked");  w.Bool(obj.locked);
  w.Key("visible"); w.Bool(obj.visible);
  w.Key("zIndex");  w.Int(obj.zIndex);
  if (!obj.meta.empty()) {
    w.Key("meta");
    writeMeta(w, obj.meta);
  }
  w.EndObject();
}

std::string writeDrawingDocument(const ObjectList& objects, std::int64_t timestampMs) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("version");   w.String(kExportVersion);
  w.Key("timestamp"); w.Int64(timestampMs);
  w.Key("objects");
  w.StartArray();
  for (const auto& h : objects) writeDrawingObject(w, *h);
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

// ---- Reading ----

static double numberOr(const rapidjson::Value& v, const char* key, double fallback) {
  if (v.HasMember(key) && v[key].IsNumber()) return v[key].GetDouble();
  return fallback;
}

static void readString(const rapidjson::Value& v, const char* key, std::string& out) {
  if (v.HasMember(key) && v[key].IsString()) out = v[key].GetString();
}

static void readStyle(const rapidjson::Value& v, DrawingStyle& s) {
  readString(v, "color", s.color);
  s.lineWidth = numberOr(v, "lineWidth", s.lineWidth);
  if (v.HasMember("lineStyle") && v["lineStyle"].IsString()) {
    LineStyle ls;
    if (parseLineStyle(v["lineStyle"].GetString(), ls)) s.lineStyle = ls;
  }
  readString(v, "fillColor", s.fillColor);
  s.opacity = numberOr(v, "opacity", s.opacity);
  s.fontSize = numberOr(v, "fontSize", s.fontSize);
  readString(v, "fontFamily", s.fontFamily);
  readString(v, "fontWeight", s.fontWeight);
}

static void readMeta(const rapidjson::Value& v, MetaBag& meta) {
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const rapidjson::Value& m = it->value;
    std::string key = it->name.GetString();
    if (m.IsNumber()) {
      meta[key] = MetaValue::ofNumber(m.GetDouble());
    } else if (m.IsString()) {
      meta[key] = MetaValue::ofText(m.GetString());
    } else if (m.IsBool()) {
      meta[key] = MetaValue::ofFlag(m.GetBool());
    } else if (m.IsArray()) {
      std::vector<double> nums;
      bool numeric = true;
      for (const auto& e : m.GetArray()) {
        if (!e.IsNumber()) { numeric = false; break; }
        nums.push_back(e.GetDouble());
      }
      if (numeric) meta[key] = MetaValue::ofNumbers(nums);
    }
    // nested objects and nulls have no meta representation
  }
}

bool readDrawingObject(const rapidjson::Value& v, DrawingObject& out, std::string& error) {
  if (!v.IsObject()) {
    error = "element is not an object";
    return false;
  }
  if (!v.HasMember("type") || !v["type"].IsString()) {
    error = "missing type";
    return false;
  }
  DrawingObject obj;
  if (!parseDrawingType(v["type"].GetString(), obj.type)) {
    error = std::string("unknown type '") + v["type"].GetString() + "'";
    return false;
  }
  if (!v.HasMember("points") || !v["points"].IsArray()) {
    error = "missing points";
    return false;
  }

  readString(v, "id", obj.id);
  if (v.HasMember("paneId") && v["paneId"].IsString()) {
    PaneId pane;
    if (parsePaneId(v["paneId"].GetString(), pane)) obj.paneId = pane;
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (const auto& pv : v["points"].GetArray()) {
    WorldPoint wp{nan, nan};
    if (pv.IsObject()) {
      wp.t = numberOr(pv, "t", nan);
      wp.p = numberOr(pv, "p", nan);
    }
    obj.points.push_back(wp);
  }

  if (v.HasMember("style") && v["style"].IsObject()) readStyle(v["style"], obj.style);
  if (v.HasMember("locked") && v["locked"].IsBool()) obj.locked = v["locked"].GetBool();
  if (v.HasMember("visible") && v["visible"].IsBool()) obj.visible = v["visible"].GetBool();
  if (v.HasMember("zIndex")) {
    if (v["zIndex"].IsInt())
      obj.zIndex = v["zIndex"].GetInt();
    else if (v["zIndex"].IsNumber())
      obj.zIndex = clampedInteger<int>(v["zIndex"].GetDouble(), obj.zIndex);
  }
  if (v.HasMember("meta") && v["meta"].IsObject()) readMeta(v["meta"], obj.meta);

  out = std::move(obj);
  return true;
}

bool parseDrawingDocument(const std::string& json, DrawingDocument& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(json.c_str());
  if (doc.HasParseError()) return false;
  if (!doc.IsObject()) return false;
  if (!doc.HasMember("objects") || !doc["objects"].IsArray()) return false;

  DrawingDocument parsed;
  readString(doc, "version", parsed.version);
  if (doc.HasMember("timestamp")) {
    if (doc["timestamp"].IsInt64())
      parsed.timestampMs = doc["timestamp"].GetInt64();
    else if (doc["timestamp"].IsNumber())
      parsed.timestampMs = clampedInteger<std::int64_t>(doc["timestamp"].GetDouble(), parsed.timestampMs);
  }

  std::size_t index = 0;
  for (const auto& v : doc["objects"].GetArray()) {
    DrawingObject obj;
    std::string error;
    if (readDrawingObject(v, obj, error))
      parsed.objects.push_back(std::move(obj));
    else
      parsed.skipped.push_back("objects[" + std::to_string(index) + "]: " + error);
    ++index;
  }

  out = std::move(parsed);
  return true;
}

} // namespace tc
