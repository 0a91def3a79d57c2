// Scripted input replay for TraceChart
// Loads bars, replays pointer/key events into the drawing engine, then
// prints the exported drawings (and optionally the recorded frame).
//
// Usage: tracechart_replay <bars.json> <script.json> [--config engine.json]
//                          [--render | --state]
//
// Script:
//   {"canvas": {"w": 800, "h": 600}, "timeframe": "ALL",
//    "events": [
//      {"cmd": "tool", "id": "trendline"},
//      {"cmd": "down", "t": 1700000000000, "p": 101.5},   world coordinates
//      {"cmd": "move", "x": 320, "y": 210},                screen coordinates
//      {"cmd": "up"},
//      {"cmd": "key", "code": "Escape"},
//      {"cmd": "key", "char": "z", "ctrl": true},
//      {"cmd": "text", "text": "Breakout"},                sets the last created text
//      {"cmd": "scroll", "x": 400, "dy": -120},
//      {"cmd": "timeframe", "period": "3M"},
//      {"cmd": "undo"}, {"cmd": "redo"}, {"cmd": "clear"}]}

#include "tc/config/EngineConfig.hpp"
#include "tc/data/BarStore.hpp"
#include "tc/debug/Diagnostics.hpp"
#include "tc/drawing/DrawingEngine.hpp"
#include "tc/render/ChartRenderer.hpp"
#include "tc/render/RecordingSink.hpp"
#include "tc/session/ChartState.hpp"
#include "tc/viewport/ViewportManager.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool readFile(const char* path, std::string& out) {
  std::FILE* f = std::fopen(path, "rb");
  if (!f) return false;
  char buf[4096];
  std::size_t n;
  out.clear();
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  std::fclose(f);
  return true;
}

static double numberOr(const rapidjson::Value& v, const char* key, double fallback) {
  if (v.HasMember(key) && v[key].IsNumber()) return v[key].GetDouble();
  return fallback;
}

static bool flag(const rapidjson::Value& v, const char* key) {
  return v.HasMember(key) && v[key].IsBool() && v[key].GetBool();
}

static bool keyFromName(const std::string& name, tc::KeyCode& out) {
  struct Entry { const char* name; tc::KeyCode code; };
  static const Entry kKeys[] = {
    {"ArrowLeft", tc::KeyCode::Left},   {"ArrowRight", tc::KeyCode::Right},
    {"ArrowUp", tc::KeyCode::Up},       {"ArrowDown", tc::KeyCode::Down},
    {"Home", tc::KeyCode::Home},        {"End", tc::KeyCode::End},
    {"Escape", tc::KeyCode::Escape},    {"Delete", tc::KeyCode::Delete},
    {"Backspace", tc::KeyCode::Backspace}, {"Enter", tc::KeyCode::Enter},
  };
  for (const auto& e : kKeys) {
    if (name == e.name) {
      out = e.code;
      return true;
    }
  }
  return false;
}

// Pointer events carry either world {t, p} or screen {x, y} coordinates.
static bool dispatchPointer(tc::DrawingEngine& engine, const std::string& cmd,
                            const rapidjson::Value& ev) {
  bool world = ev.HasMember("t") || ev.HasMember("p");
  if (world) {
    tc::WorldPoint w{numberOr(ev, "t", NAN), numberOr(ev, "p", NAN)};
    if (cmd == "down") return engine.pointerDownAt(w);
    if (cmd == "move") return engine.pointerMoveAt(w);
    return engine.pointerUpAt(w);
  }
  double x = numberOr(ev, "x", 0.0);
  double y = numberOr(ev, "y", 0.0);
  if (cmd == "down") return engine.onPointerDown(x, y);
  if (cmd == "move") return engine.onPointerMove(x, y);
  return engine.onPointerUp(x, y);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
  const char* barsPath = nullptr;
  const char* scriptPath = nullptr;
  const char* configPath = nullptr;
  bool dumpRender = false;
  bool dumpState = false;

  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      configPath = argv[++i];
    } else if (std::strcmp(argv[i], "--render") == 0) {
      dumpRender = true;
    } else if (std::strcmp(argv[i], "--state") == 0) {
      dumpState = true;
    } else if (!barsPath) {
      barsPath = argv[i];
    } else if (!scriptPath) {
      scriptPath = argv[i];
    } else {
      std::fprintf(stderr, "unexpected argument: %s\n", argv[i]);
      return 2;
    }
  }
  if (!barsPath || !scriptPath) {
    std::fprintf(stderr,
      "usage: %s <bars.json> <script.json> [--config engine.json] [--render | --state]\n", argv[0]);
    return 2;
  }

  // ---- 1. Configuration ----
  tc::EngineConfig cfg;
  if (configPath) {
    std::string text;
    if (!readFile(configPath, text) || !tc::loadEngineConfig(text, cfg)) {
      std::fprintf(stderr, "cannot load config %s\n", configPath);
      return 1;
    }
  }
  tc::StderrDiagnostics diag(cfg.logLevel);

  // ---- 2. Bars ----
  tc::BarStore store;
  {
    std::string text;
    if (!readFile(barsPath, text) || !tc::loadBarsJSON(text, store)) {
      std::fprintf(stderr, "cannot load bars %s\n", barsPath);
      return 1;
    }
  }

  // ---- 3. Script ----
  rapidjson::Document script;
  {
    std::string text;
    if (!readFile(scriptPath, text)) {
      std::fprintf(stderr, "cannot read script %s\n", scriptPath);
      return 1;
    }
    script.Parse(text.c_str());
    if (script.HasParseError() || !script.IsObject() ||
        !script.HasMember("events") || !script["events"].IsArray()) {
      std::fprintf(stderr, "script must be an object with an 'events' array\n");
      return 1;
    }
  }

  // ---- 4. Viewport + engine ----
  tc::ViewportManager vp;
  int W = 800, H = 600;
  if (script.HasMember("canvas") && script["canvas"].IsObject()) {
    W = static_cast<int>(numberOr(script["canvas"], "w", W));
    H = static_cast<int>(numberOr(script["canvas"], "h", H));
  }
  vp.setCanvasSize(W, H);
  vp.setData(store);
  if (script.HasMember("timeframe") && script["timeframe"].IsString()) {
    if (!vp.applyTimeframe(script["timeframe"].GetString()))
      std::fprintf(stderr, "unknown timeframe %s\n", script["timeframe"].GetString());
  }

  tc::DrawingEngine engine(cfg, diag);
  engine.attachViewport(&vp);

  std::string lastTextId;
  engine.events().textEditRequested.subscribe(
    [&](const tc::DrawingObject& obj) { lastTextId = obj.id; });

  // ---- 5. Replay ----
  int index = 0;
  for (const auto& ev : script["events"].GetArray()) {
    ++index;
    if (!ev.IsObject() || !ev.HasMember("cmd") || !ev["cmd"].IsString()) {
      std::fprintf(stderr, "event %d: missing cmd, skipped\n", index);
      continue;
    }
    std::string cmd = ev["cmd"].GetString();

    if (cmd == "down" || cmd == "move" || cmd == "up") {
      dispatchPointer(engine, cmd, ev);
    }
    else if (cmd == "tool") {
      engine.setTool(ev.HasMember("id") && ev["id"].IsString() ? ev["id"].GetString() : "");
    }
    else if (cmd == "key") {
      tc::KeyEvent key;
      if (ev.HasMember("char") && ev["char"].IsString() && ev["char"].GetStringLength() == 1) {
        key = tc::keyChar(ev["char"].GetString()[0], flag(ev, "ctrl"), flag(ev, "shift"));
      } else if (ev.HasMember("code") && ev["code"].IsString() &&
                 keyFromName(ev["code"].GetString(), key.code)) {
        key.ctrl = flag(ev, "ctrl");
        key.shift = flag(ev, "shift");
      } else {
        std::fprintf(stderr, "event %d: unknown key, skipped\n", index);
        continue;
      }
      key.meta = flag(ev, "meta");
      key.alt = flag(ev, "alt");
      engine.onKey(key);
    }
    else if (cmd == "text") {
      std::string id = ev.HasMember("id") && ev["id"].IsString() ? ev["id"].GetString() : lastTextId;
      std::string text = ev.HasMember("text") && ev["text"].IsString() ? ev["text"].GetString() : "";
      if (!engine.setObjectText(id, text))
        std::fprintf(stderr, "event %d: no text object '%s'\n", index, id.c_str());
    }
    else if (cmd == "scroll") {
      vp.wheelZoom(numberOr(ev, "x", W * 0.5), numberOr(ev, "dy", 0.0));
    }
    else if (cmd == "timeframe") {
      const char* period = ev.HasMember("period") && ev["period"].IsString()
                             ? ev["period"].GetString() : "";
      if (!vp.applyTimeframe(period))
        std::fprintf(stderr, "event %d: unknown timeframe '%s'\n", index, period);
    }
    else if (cmd == "undo") {
      engine.undo();
    }
    else if (cmd == "redo") {
      engine.redo();
    }
    else if (cmd == "clear") {
      engine.clearAll();
    }
    else {
      std::fprintf(stderr, "event %d: unknown cmd '%s', skipped\n", index, cmd.c_str());
    }
  }

  // ---- 6. Output ----
  if (dumpRender) {
    tc::RecordingSink sink;
    tc::ChartRenderer chart;
    chart.addStandardOverlays(vp.bars());
    chart.render(sink, vp.transform());
    engine.render(sink);
    std::printf("%s\n", sink.toJSON().c_str());
  } else if (dumpState) {
    tc::ChartState state = tc::captureChartState(vp, engine);
    std::printf("%s\n", tc::serializeChartState(state).c_str());
  } else {
    std::printf("%s\n", engine.exportObjects().c_str());
  }
  return 0;
}
