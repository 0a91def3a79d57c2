#pragma once
#include "tc/debug/Diagnostics.hpp"
#include "tc/drawing/DrawingTypes.hpp"
#include "tc/drawing/Snapper.hpp"
#include "tc/viewport/KeyboardNav.hpp"
#include "tc/viewport/ViewportState.hpp"

#include <cstddef>
#include <string>

namespace tc {

struct EngineConfig {
  double hitThresholdPx{8.0};
  double handleRadiusPx{5.0};
  SnapConfig snap;
  std::size_t maxHistory{100};
  std::size_t maxObjects{500};
  LogLevel logLevel{LogLevel::Warn};
  bool performanceMetrics{false};
  double draftOpacity{0.6};
  DrawingStyle defaultStyle;
};

// Overlay the fields present in `json` onto `cfg`; absent fields keep their
// current values. Returns false on malformed JSON (cfg untouched).
//
// {"hitThresholdPx": 8, "handleRadiusPx": 5, "maxHistory": 100,
//  "maxObjects": 500, "logLevel": "warn", "performanceMetrics": false,
//  "draftOpacity": 0.6,
//  "snap": {"enabled": true, "time": true, "price": true, "objects": true,
//           "thresholdPx": 12},
//  "defaultStyle": {"color": "#0EA5E9", "lineWidth": 2, ...}}
bool loadEngineConfig(const std::string& json, EngineConfig& cfg);

// {"minBars": 20, "maxBars": 2000, "pricePaddingFraction": 0.08, ...}
bool loadViewportConfig(const std::string& json, ViewportConfig& cfg);

// {"panFraction": 0.1, "zoomFraction": 0.2}
bool loadKeyboardNavConfig(const std::string& json, KeyboardNavConfig& cfg);

std::string serializeEngineConfig(const EngineConfig& cfg);

} // namespace tc
