#pragma once
#include "tc/render/RenderSink.hpp"
#include "tc/style/Theme.hpp"
#include "tc/viewport/CoordinateTransform.hpp"

#include <string>
#include <vector>

namespace tc {

// One indicator series drawn over the candles. `values` is aligned to bar
// indices; NaN entries break the line.
struct OverlayLine {
  std::string label;
  std::vector<double> values;
  float color[4] = {0.3f, 0.5f, 1.0f, 1.0f};
  double lineWidth{1.5};
};

struct ChartRendererConfig {
  bool showGrid{true};
  bool showVolume{true};
  double volumePaneFraction{0.2};    // volume bars use the bottom 20%
  double candleBodyFraction{0.7};    // body width relative to bar spacing
  int priceTickTarget{5};
  int timeTickTarget{6};
  double labelFontSize{11.0};
  std::string fontFamily{"sans-serif"};
};

// Draws the price chart (grid, volume, candles, overlays) through a
// RenderSink. The drawing engine renders its objects on top afterwards.
class ChartRenderer {
public:
  void setConfig(const ChartRendererConfig& cfg) { config_ = cfg; }
  const ChartRendererConfig& config() const { return config_; }

  void setTheme(const Theme& theme) { theme_ = theme; }
  const Theme& theme() const { return theme_; }

  void addOverlay(const OverlayLine& line) { overlays_.push_back(line); }
  void clearOverlays() { overlays_.clear(); }
  const std::vector<OverlayLine>& overlays() const { return overlays_; }

  // SMA 20, EMA 50 and Bollinger(20, 2) over `bars`, coloured from the theme.
  void addStandardOverlays(const BarSeries& bars);

  void render(RenderSink& sink, const CoordinateTransform& xf) const;

  void renderBackground(RenderSink& sink, const CoordinateTransform& xf) const;
  void renderGrid(RenderSink& sink, const CoordinateTransform& xf) const;
  void renderVolume(RenderSink& sink, const CoordinateTransform& xf) const;
  void renderCandles(RenderSink& sink, const CoordinateTransform& xf) const;
  void renderOverlays(RenderSink& sink, const CoordinateTransform& xf) const;

  // Bars whose index lies in the visible window, clamped to the series.
  // False when none are visible.
  static bool visibleIndices(const CoordinateTransform& xf, std::size_t& first, std::size_t& last);

private:
  ChartRendererConfig config_;
  Theme theme_;
  std::vector<OverlayLine> overlays_;
};

} // namespace tc
