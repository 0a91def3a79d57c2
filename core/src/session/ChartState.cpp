#include "tc/session/ChartState.hpp"
#include "tc/drawing/DrawingEngine.hpp"
#include "tc/viewport/ViewportManager.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tc {

std::string serializeChartState(const ChartState& state) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", rapidjson::Value(state.version.c_str(), alloc), alloc);
  doc.AddMember("symbol", rapidjson::Value(state.symbol.c_str(), alloc), alloc);
  doc.AddMember("timeframe", rapidjson::Value(state.timeframe.c_str(), alloc), alloc);
  doc.AddMember("theme", rapidjson::Value(state.themeName.c_str(), alloc), alloc);

  rapidjson::Value vp(rapidjson::kObjectType);
  vp.AddMember("visibleStart", state.viewport.visibleStart, alloc);
  vp.AddMember("visibleEnd", state.viewport.visibleEnd, alloc);
  vp.AddMember("priceMin", state.viewport.priceMin, alloc);
  vp.AddMember("priceMax", state.viewport.priceMax, alloc);
  vp.AddMember("autoScalePrice", state.viewport.autoScalePrice, alloc);
  doc.AddMember("viewport", vp, alloc);

  // Drawings are embedded as a nested object, not an escaped string
  if (!state.drawingsJSON.empty()) {
    rapidjson::Document drawDoc;
    drawDoc.Parse<rapidjson::kParseNanAndInfFlag>(state.drawingsJSON.c_str());
    if (!drawDoc.HasParseError() && drawDoc.IsObject()) {
      rapidjson::Value drawCopy(drawDoc, alloc);
      doc.AddMember("drawings", drawCopy, alloc);
    }
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                    rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

static void readNumber(const rapidjson::Value& v, const char* key, double& out) {
  if (v.HasMember(key) && v[key].IsNumber()) out = v[key].GetDouble();
}

static void readString(const rapidjson::Value& v, const char* key, std::string& out) {
  if (v.HasMember(key) && v[key].IsString()) out = v[key].GetString();
}

bool deserializeChartState(const std::string& json, ChartState& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  readString(doc, "version", out.version);
  readString(doc, "symbol", out.symbol);
  readString(doc, "timeframe", out.timeframe);
  readString(doc, "theme", out.themeName);

  if (doc.HasMember("viewport") && doc["viewport"].IsObject()) {
    const auto& vp = doc["viewport"];
    readNumber(vp, "visibleStart", out.viewport.visibleStart);
    readNumber(vp, "visibleEnd", out.viewport.visibleEnd);
    readNumber(vp, "priceMin", out.viewport.priceMin);
    readNumber(vp, "priceMax", out.viewport.priceMax);
    if (vp.HasMember("autoScalePrice") && vp["autoScalePrice"].IsBool())
      out.viewport.autoScalePrice = vp["autoScalePrice"].GetBool();
  }

  // Re-serialize the embedded document back to a JSON string
  if (doc.HasMember("drawings") && doc["drawings"].IsObject()) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                      rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag> writer(sb);
    doc["drawings"].Accept(writer);
    out.drawingsJSON = sb.GetString();
  }
  return true;
}

ChartState captureChartState(const ViewportManager& vp, const DrawingEngine& engine) {
  const ViewportState& st = vp.state();
  ChartState state;
  state.timeframe = timeframeName(st.timeframe);
  state.viewport.visibleStart = st.visibleStart;
  state.viewport.visibleEnd = st.visibleEnd;
  state.viewport.priceMin = st.priceMin;
  state.viewport.priceMax = st.priceMax;
  state.viewport.autoScalePrice = st.autoScalePrice;
  state.drawingsJSON = engine.exportObjects();
  return state;
}

bool applyChartState(const ChartState& state, ViewportManager& vp, DrawingEngine& engine) {
  vp.setVisibleRange(state.viewport.visibleStart, state.viewport.visibleEnd);
  if (state.viewport.autoScalePrice)
    vp.fitPriceToVisible();
  else
    vp.setPriceRange(state.viewport.priceMin, state.viewport.priceMax);

  if (state.drawingsJSON.empty()) return true;
  return engine.importObjects(state.drawingsJSON);
}

} // namespace tc
