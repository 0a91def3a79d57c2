#pragma once
#include "tc/data/BarStore.hpp"
#include "tc/viewport/AutoScale.hpp"
#include "tc/viewport/CoordinateTransform.hpp"
#include "tc/viewport/ViewportState.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace tc {

enum class DataEdge : std::uint8_t { Left, Right };

// Owns the visible bar window, the price range and the canvas size.
// Window requests outside the valid bounds are clamped, never rejected:
//   span  in [min(minBars, n), min(maxBars, n)]
//   window inside [-0.5, n - 0.5]
class ViewportManager {
public:
  using RangeListener = std::function<void(double visibleStart, double visibleEnd)>;
  using EdgeListener = std::function<void(DataEdge edge)>;

  ViewportManager();

  void setConfig(const ViewportConfig& cfg);
  const ViewportConfig& config() const { return config_; }

  void setData(BarSnapshot bars);
  void setData(const BarStore& store) { setData(store.snapshot()); }
  void setCanvasSize(int widthPx, int heightPx);

  // Show the most recent N bars for the period. Unknown periods return
  // false and leave the viewport untouched.
  bool applyTimeframe(Timeframe tf);
  bool applyTimeframe(const std::string& period);

  void panBy(double deltaBars);
  void panByPixels(double dxPixels);   // drag right -> earlier bars
  void wheelZoom(double pixelX, double deltaY);

  // Scale the span by 1/factor keeping the index under anchorX fixed.
  void zoomAt(double factor, double anchorX);

  void setVisibleRange(double start, double end);
  void showAll();
  void scrollToLatest();

  // Manual price scale; disables auto-scaling until the next timeframe.
  void setPriceRange(double priceMin, double priceMax);
  void fitPriceToVisible();

  double timeToX(double t) const { return transform().timeToX(t); }
  double xToTime(double x) const { return transform().xToTime(x); }
  double priceToY(double p) const { return transform().priceToY(p); }
  double yToPrice(double y) const { return transform().yToPrice(y); }

  CoordinateTransform transform() const;
  const ViewportState& state() const { return state_; }
  const BarSeries& bars() const { return *bars_; }
  BarSnapshot barSnapshot() const { return bars_; }

  // Index range of bars overlapping the visible window. False if none.
  bool visibleBarRange(std::size_t& first, std::size_t& last) const;

  double minSpan() const;
  double maxSpan() const;

  void setRangeListener(RangeListener cb) { rangeListener_ = std::move(cb); }
  void setEdgeListener(EdgeListener cb) { edgeListener_ = std::move(cb); }

private:
  void setWindow(double start, double span);
  void clampWindow();
  void refresh();   // price range (if auto), derived fields, listeners

  ViewportConfig config_;
  AutoScale autoScale_;
  ViewportState state_;
  BarSnapshot bars_;

  RangeListener rangeListener_;
  EdgeListener edgeListener_;
  bool nearLeftEdge_{false};
  bool nearRightEdge_{false};
};

} // namespace tc
