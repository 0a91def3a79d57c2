// T7.1: JSON configuration and diagnostics levels

#include "tc/config/EngineConfig.hpp"
#include "tc/drawing/DrawingEngine.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

struct CaptureDiagnostics : tc::Diagnostics {
  std::vector<tc::LogLevel> levels;
  void log(tc::LogLevel level, const std::string&) override { levels.push_back(level); }
};

int main() {
  // ---- Test 1: engine config overlay ----
  {
    tc::EngineConfig cfg;
    cfg.maxObjects = 77;
    bool ok = tc::loadEngineConfig(
        "{\"hitThresholdPx\": 6, \"maxHistory\": 20, \"logLevel\": \"debug\","
        " \"performanceMetrics\": true,"
        " \"snap\": {\"time\": false, \"thresholdPx\": 4},"
        " \"defaultStyle\": {\"color\": \"#22C55E\", \"lineStyle\": \"dotted\", \"lineWidth\": 3}}",
        cfg);
    requireTrue(ok, "loads");
    requireTrue(cfg.hitThresholdPx == 6.0 && cfg.maxHistory == 20, "top-level fields");
    requireTrue(cfg.logLevel == tc::LogLevel::Debug && cfg.performanceMetrics, "level + metrics");
    requireTrue(cfg.maxObjects == 77, "absent fields keep their value");
    requireTrue(cfg.handleRadiusPx == 5.0 && cfg.draftOpacity == 0.6, "defaults kept");
    requireTrue(!cfg.snap.snapToTime && cfg.snap.snapToPrice && cfg.snap.enabled, "snap overlay");
    requireTrue(cfg.snap.thresholdPx == 4.0, "snap threshold");
    requireTrue(cfg.defaultStyle.color == "#22C55E", "style color");
    requireTrue(cfg.defaultStyle.lineStyle == tc::LineStyle::Dotted, "style dash");
    requireTrue(cfg.defaultStyle.lineWidth == 3.0 && cfg.defaultStyle.fontSize == 14.0, "style widths");
    std::printf("  Test 1 (engine overlay): PASS\n");
  }

  // ---- Test 2: bad input ----
  {
    tc::EngineConfig cfg;
    cfg.hitThresholdPx = 9;
    requireTrue(!tc::loadEngineConfig("{\"hitThresholdPx\": 3", cfg), "truncated");
    requireTrue(!tc::loadEngineConfig("[1, 2]", cfg), "not an object");
    requireTrue(cfg.hitThresholdPx == 9.0, "untouched");

    requireTrue(tc::loadEngineConfig(
        "{\"hitThresholdPx\": \"wide\", \"maxHistory\": -4, \"logLevel\": \"loud\","
        " \"defaultStyle\": {\"lineStyle\": \"wavy\"}}", cfg), "wrong types tolerated");
    requireTrue(cfg.hitThresholdPx == 9.0 && cfg.maxHistory == 100, "wrong types ignored");
    requireTrue(cfg.logLevel == tc::LogLevel::Warn, "unknown level ignored");
    requireTrue(cfg.defaultStyle.lineStyle == tc::LineStyle::Solid, "unknown dash ignored");
    std::printf("  Test 2 (bad input): PASS\n");
  }

  // ---- Test 3: serialize and reload ----
  {
    tc::EngineConfig cfg;
    cfg.maxObjects = 12;
    cfg.logLevel = tc::LogLevel::Error;
    cfg.snap.snapToObjects = false;
    cfg.defaultStyle.fillColor = "#10B98133";
    cfg.defaultStyle.lineStyle = tc::LineStyle::Dashed;
    std::string json = tc::serializeEngineConfig(cfg);

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    requireTrue(!doc.HasParseError(), "valid json");
    requireTrue(std::string(doc["logLevel"].GetString()) == "error", "level by name");
    requireTrue(std::string(doc["defaultStyle"]["lineStyle"].GetString()) == "dashed", "dash by name");

    tc::EngineConfig back;
    requireTrue(tc::loadEngineConfig(json, back), "reload");
    requireTrue(back.maxObjects == 12 && back.logLevel == tc::LogLevel::Error, "fields");
    requireTrue(!back.snap.snapToObjects && back.snap.snapToTime, "snap");
    requireTrue(back.defaultStyle == cfg.defaultStyle, "style");
    std::printf("  Test 3 (round trip): PASS\n");
  }

  // ---- Test 4: viewport and keyboard config ----
  {
    tc::ViewportConfig vc;
    requireTrue(tc::loadViewportConfig("{\"minBars\": 5, \"defaultBarIntervalMs\": 60000}", vc), "viewport");
    requireTrue(vc.minBars == 5 && vc.defaultBarIntervalMs == 60000 && vc.maxBars == 2000, "viewport fields");
    requireTrue(!tc::loadViewportConfig("nope", vc) && vc.minBars == 5, "viewport bad");

    tc::KeyboardNavConfig kc;
    requireTrue(tc::loadKeyboardNavConfig("{\"panFraction\": 0.25}", kc), "keys");
    requireTrue(kc.panFraction == 0.25 && kc.zoomFraction == 0.2, "keys fields");
    requireTrue(!tc::loadKeyboardNavConfig("", kc), "keys bad");
    std::printf("  Test 4 (viewport/keys): PASS\n");
  }

  // ---- Test 5: log levels ----
  {
    const char* names[] = {"debug", "info", "warn", "error", "off"};
    for (const char* n : names) {
      tc::LogLevel level = tc::LogLevel::Debug;
      requireTrue(tc::parseLogLevel(n, level), "known level");
      requireTrue(std::string(tc::logLevelName(level)) == n, "name round trip");
    }
    tc::LogLevel keep = tc::LogLevel::Info;
    requireTrue(!tc::parseLogLevel("WARN", keep) && keep == tc::LogLevel::Info, "case sensitive");

    tc::StderrDiagnostics err;
    requireTrue(err.minLevel() == tc::LogLevel::Warn, "default threshold");
    err.setMinLevel(tc::LogLevel::Off);
    err.log(tc::LogLevel::Error, "suppressed");
    err.metric("suppressed", 1.0);

    tc::NullDiagnostics quiet;
    quiet.log(tc::LogLevel::Error, "dropped");
    requireTrue(&tc::nullDiagnostics() == &tc::nullDiagnostics(), "shared fallback");
    std::printf("  Test 5 (levels): PASS\n");
  }

  // ---- Test 6: the engine honours its configured level and depth ----
  {
    CaptureDiagnostics diag;
    tc::EngineConfig cfg;
    cfg.logLevel = tc::LogLevel::Error;
    cfg.maxHistory = 2;
    tc::DrawingEngine engine(cfg, diag);

    requireTrue(!engine.pointerDownAt({1000, 10}), "no viewport");
    requireTrue(diag.levels.empty(), "warning filtered by level");

    tc::DrawingObject obj;
    obj.type = tc::DrawingType::HorizontalLine;
    obj.points.push_back({1000, 10});
    for (int i = 0; i < 4; i++) engine.addObject(obj);
    requireTrue(engine.objectCount() == 4, "added");
    requireTrue(engine.undo() && engine.undo() && !engine.undo(), "depth bounded");
    requireTrue(engine.objectCount() == 2, "two steps back");

    cfg.logLevel = tc::LogLevel::Debug;
    engine.setConfig(cfg);
    engine.pointerDownAt({1000, 10});
    requireTrue(!diag.levels.empty(), "warning delivered at debug level");
    std::printf("  Test 6 (engine level): PASS\n");
  }

  std::printf("T7.1 config: ALL PASS\n");
  return 0;
}
