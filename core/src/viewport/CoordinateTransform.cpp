#include "tc/viewport/CoordinateTransform.hpp"

#include <algorithm>
#include <cmath>

namespace tc {

static const BarSnapshot& emptyBars() {
  static const BarSnapshot empty = std::make_shared<const BarSeries>();
  return empty;
}

CoordinateTransform::CoordinateTransform() : bars_(emptyBars()) {}

CoordinateTransform::CoordinateTransform(const ViewportState& state, BarSnapshot bars,
                                         double defaultIntervalMs)
  : state_(state),
    bars_(bars ? std::move(bars) : emptyBars()),
    defaultIntervalMs_(defaultIntervalMs > 0.0 ? defaultIntervalMs : 86400000.0) {}

ScreenPoint CoordinateTransform::worldToScreen(const WorldPoint& w) const {
  return ScreenPoint{timeToX(w.t), priceToY(w.p)};
}

WorldPoint CoordinateTransform::screenToWorld(const ScreenPoint& s) const {
  return WorldPoint{xToTime(s.x), yToPrice(s.y)};
}

double CoordinateTransform::edgeInterval(bool leading) const {
  const auto& b = *bars_;
  if (b.size() < 2) return defaultIntervalMs_;
  double dt = leading
    ? static_cast<double>(b[1].timestamp - b[0].timestamp)
    : static_cast<double>(b[b.size() - 1].timestamp - b[b.size() - 2].timestamp);
  return dt > 0.0 ? dt : defaultIntervalMs_;
}

double CoordinateTransform::timeToIndex(double t) const {
  const auto& b = *bars_;
  if (b.empty()) return t / defaultIntervalMs_;

  const double first = static_cast<double>(b.front().timestamp);
  const double last = static_cast<double>(b.back().timestamp);
  if (t <= first) return (t - first) / edgeInterval(true);
  if (t >= last) return static_cast<double>(b.size() - 1) + (t - last) / edgeInterval(false);

  // b[i].timestamp <= t < b[i+1].timestamp
  auto it = std::upper_bound(b.begin(), b.end(), t,
    [](double v, const Bar& bar) { return v < static_cast<double>(bar.timestamp); });
  std::size_t i = static_cast<std::size_t>(it - b.begin()) - 1;
  double t0 = static_cast<double>(b[i].timestamp);
  double t1 = static_cast<double>(b[i + 1].timestamp);
  return static_cast<double>(i) + (t - t0) / (t1 - t0);
}

double CoordinateTransform::indexToTime(double index) const {
  const auto& b = *bars_;
  if (b.empty()) return index * defaultIntervalMs_;

  const double lastIndex = static_cast<double>(b.size() - 1);
  if (index <= 0.0)
    return static_cast<double>(b.front().timestamp) + index * edgeInterval(true);
  if (index >= lastIndex)
    return static_cast<double>(b.back().timestamp) + (index - lastIndex) * edgeInterval(false);

  double fl = std::floor(index);
  std::size_t i = static_cast<std::size_t>(fl);
  double frac = index - fl;
  double t0 = static_cast<double>(b[i].timestamp);
  if (frac == 0.0) return t0;
  double t1 = static_cast<double>(b[i + 1].timestamp);
  return t0 + frac * (t1 - t0);
}

double CoordinateTransform::indexToX(double index) const {
  double span = state_.visibleEnd - state_.visibleStart;
  if (span <= 0.0) return 0.0;
  return (index - state_.visibleStart) / span * width();
}

double CoordinateTransform::xToIndex(double x) const {
  double w = width();
  if (w <= 0.0) return state_.visibleStart;
  return state_.visibleStart + x / w * (state_.visibleEnd - state_.visibleStart);
}

double CoordinateTransform::priceToY(double price) const {
  double range = state_.priceMax - state_.priceMin;
  if (range <= 0.0) return height() * 0.5;
  double ratio = (price - state_.priceMin) / range;
  return height() * (1.0 - ratio);
}

double CoordinateTransform::yToPrice(double y) const {
  double h = height();
  if (h <= 0.0) return state_.priceMin;
  double ratio = 1.0 - y / h;
  return state_.priceMin + ratio * (state_.priceMax - state_.priceMin);
}

double CoordinateTransform::pixelsPerBar() const {
  double span = state_.visibleEnd - state_.visibleStart;
  if (span <= 0.0) return 0.0;
  return width() / span;
}

} // namespace tc
