#pragma once
#include <string>

namespace tc {

class DrawingEngine;
class ViewportManager;

// Visible window and price scale as saved in a session.
struct SavedViewport {
  double visibleStart{-0.5}, visibleEnd{0.5};
  double priceMin{0}, priceMax{1};
  bool autoScalePrice{true};
};

// Serializable chart configuration.
struct ChartState {
  std::string version{"1.0"};
  std::string symbol;        // e.g. "BTCUSD"
  std::string timeframe;     // e.g. "1Y", "Custom"
  std::string themeName;     // "Dark", "Light"
  SavedViewport viewport;
  std::string drawingsJSON;  // DrawingEngine::exportObjects() output
};

std::string serializeChartState(const ChartState& state);

// Fields absent from `json` keep their current values. Returns false on
// malformed JSON.
bool deserializeChartState(const std::string& json, ChartState& out);

// Snapshot the live viewport and drawings.
ChartState captureChartState(const ViewportManager& vp, const DrawingEngine& engine);

// Restore the window, the manual price scale (if any) and the drawings.
// False when the embedded drawings document is rejected; the viewport is
// restored either way.
bool applyChartState(const ChartState& state, ViewportManager& vp, DrawingEngine& engine);

} // namespace tc
