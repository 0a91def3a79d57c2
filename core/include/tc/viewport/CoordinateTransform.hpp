#pragma once
#include "tc/data/BarStore.hpp"
#include "tc/math/Geometry.hpp"
#include "tc/viewport/ViewportState.hpp"

namespace tc {

// Immutable snapshot of the viewport mapping. Copying is cheap (state by
// value, bars by shared pointer), so renderers and the drawing engine take
// one per frame or per event and never observe a half-updated viewport.
class CoordinateTransform {
public:
  CoordinateTransform();
  CoordinateTransform(const ViewportState& state, BarSnapshot bars,
                      double defaultIntervalMs);

  ScreenPoint worldToScreen(const WorldPoint& w) const;
  WorldPoint screenToWorld(const ScreenPoint& s) const;

  // Timestamp <-> fractional bar index. Interpolates between neighbouring
  // bars and extrapolates past the ends using the edge bar interval.
  double timeToIndex(double t) const;
  double indexToTime(double index) const;

  double indexToX(double index) const;
  double xToIndex(double x) const;

  double timeToX(double t) const { return indexToX(timeToIndex(t)); }
  double xToTime(double x) const { return indexToTime(xToIndex(x)); }

  double priceToY(double price) const;
  double yToPrice(double y) const;

  double pixelsPerBar() const;
  double width() const { return static_cast<double>(state_.widthPx); }
  double height() const { return static_cast<double>(state_.heightPx); }

  const ViewportState& state() const { return state_; }
  const BarSeries& bars() const { return *bars_; }

private:
  double edgeInterval(bool leading) const;

  ViewportState state_;
  BarSnapshot bars_;
  double defaultIntervalMs_{86400000.0};
};

} // namespace tc
