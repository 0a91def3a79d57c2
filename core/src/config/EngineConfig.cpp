#include "tc/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tc {

static void readDouble(const rapidjson::Value& v, const char* key, double& out) {
  if (v.HasMember(key) && v[key].IsNumber()) out = v[key].GetDouble();
}

static void readBool(const rapidjson::Value& v, const char* key, bool& out) {
  if (v.HasMember(key) && v[key].IsBool()) out = v[key].GetBool();
}

static void readSize(const rapidjson::Value& v, const char* key, std::size_t& out) {
  if (v.HasMember(key) && v[key].IsUint()) out = v[key].GetUint();
}

static void readText(const rapidjson::Value& v, const char* key, std::string& out) {
  if (v.HasMember(key) && v[key].IsString()) out = v[key].GetString();
}

static bool parseObject(const std::string& json, rapidjson::Document& doc) {
  doc.Parse(json.c_str());
  return !doc.HasParseError() && doc.IsObject();
}

bool loadEngineConfig(const std::string& json, EngineConfig& cfg) {
  rapidjson::Document doc;
  if (!parseObject(json, doc)) return false;

  EngineConfig out = cfg;
  readDouble(doc, "hitThresholdPx", out.hitThresholdPx);
  readDouble(doc, "handleRadiusPx", out.handleRadiusPx);
  readSize(doc, "maxHistory", out.maxHistory);
  readSize(doc, "maxObjects", out.maxObjects);
  readBool(doc, "performanceMetrics", out.performanceMetrics);
  readDouble(doc, "draftOpacity", out.draftOpacity);

  if (doc.HasMember("logLevel") && doc["logLevel"].IsString()) {
    LogLevel level;
    if (parseLogLevel(doc["logLevel"].GetString(), level)) out.logLevel = level;
  }

  if (doc.HasMember("snap") && doc["snap"].IsObject()) {
    const auto& s = doc["snap"];
    readBool(s, "enabled", out.snap.enabled);
    readBool(s, "time", out.snap.snapToTime);
    readBool(s, "price", out.snap.snapToPrice);
    readBool(s, "objects", out.snap.snapToObjects);
    readDouble(s, "thresholdPx", out.snap.thresholdPx);
  }

  if (doc.HasMember("defaultStyle") && doc["defaultStyle"].IsObject()) {
    const auto& s = doc["defaultStyle"];
    DrawingStyle& st = out.defaultStyle;
    readText(s, "color", st.color);
    readDouble(s, "lineWidth", st.lineWidth);
    if (s.HasMember("lineStyle") && s["lineStyle"].IsString()) {
      LineStyle ls;
      if (parseLineStyle(s["lineStyle"].GetString(), ls)) st.lineStyle = ls;
    }
    readText(s, "fillColor", st.fillColor);
    readDouble(s, "opacity", st.opacity);
    readDouble(s, "fontSize", st.fontSize);
    readText(s, "fontFamily", st.fontFamily);
    readText(s, "fontWeight", st.fontWeight);
  }

  cfg = out;
  return true;
}

bool loadViewportConfig(const std::string& json, ViewportConfig& cfg) {
  rapidjson::Document doc;
  if (!parseObject(json, doc)) return false;

  ViewportConfig out = cfg;
  readDouble(doc, "minBars", out.minBars);
  readDouble(doc, "maxBars", out.maxBars);
  readDouble(doc, "pricePaddingFraction", out.pricePaddingFraction);
  readDouble(doc, "zoomSensitivity", out.zoomSensitivity);
  readDouble(doc, "defaultBarIntervalMs", out.defaultBarIntervalMs);
  readDouble(doc, "volumeHeadroom", out.volumeHeadroom);
  readDouble(doc, "edgeLoadThresholdBars", out.edgeLoadThresholdBars);
  cfg = out;
  return true;
}

bool loadKeyboardNavConfig(const std::string& json, KeyboardNavConfig& cfg) {
  rapidjson::Document doc;
  if (!parseObject(json, doc)) return false;

  readDouble(doc, "panFraction", cfg.panFraction);
  readDouble(doc, "zoomFraction", cfg.zoomFraction);
  return true;
}

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("hitThresholdPx");     w.Double(cfg.hitThresholdPx);
  w.Key("handleRadiusPx");     w.Double(cfg.handleRadiusPx);
  w.Key("maxHistory");         w.Uint64(cfg.maxHistory);
  w.Key("maxObjects");         w.Uint64(cfg.maxObjects);
  w.Key("logLevel");           w.String(logLevelName(cfg.logLevel));
  w.Key("performanceMetrics"); w.Bool(cfg.performanceMetrics);
  w.Key("draftOpacity");       w.Double(cfg.draftOpacity);

  w.Key("snap");
  w.StartObject();
  w.Key("enabled");     w.Bool(cfg.snap.enabled);
  w.Key("time");        w.Bool(cfg.snap.snapToTime);
  w.Key("price");       w.Bool(cfg.snap.snapToPrice);
  w.Key("objects");     w.Bool(cfg.snap.snapToObjects);
  w.Key("thresholdPx"); w.Double(cfg.snap.thresholdPx);
  w.EndObject();

  const DrawingStyle& st = cfg.defaultStyle;
  w.Key("defaultStyle");
  w.StartObject();
  w.Key("color");      w.String(st.color.c_str());
  w.Key("lineWidth");  w.Double(st.lineWidth);
  w.Key("lineStyle");  w.String(lineStyleName(st.lineStyle));
  w.Key("fillColor");  w.String(st.fillColor.c_str());
  w.Key("opacity");    w.Double(st.opacity);
  w.Key("fontSize");   w.Double(st.fontSize);
  w.Key("fontFamily"); w.String(st.fontFamily.c_str());
  w.Key("fontWeight"); w.String(st.fontWeight.c_str());
  w.EndObject();

  w.EndObject();
  return sb.GetString();
}

} // namespace tc
