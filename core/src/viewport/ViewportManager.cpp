#include "tc/viewport/ViewportManager.hpp"
#include "tc/math/TimeFormat.hpp"

#include <algorithm>
#include <cmath>

namespace tc {

static constexpr double kMsPerDay = 86400000.0;

ViewportManager::ViewportManager() : bars_(std::make_shared<const BarSeries>()) {
  AutoScaleConfig as;
  as.marginFraction = config_.pricePaddingFraction;
  autoScale_.setConfig(as);
  refresh();
}

void ViewportManager::setConfig(const ViewportConfig& cfg) {
  config_ = cfg;
  if (config_.minBars < 1.0) config_.minBars = 1.0;
  if (config_.maxBars < config_.minBars) config_.maxBars = config_.minBars;
  if (config_.pricePaddingFraction < 0.0) config_.pricePaddingFraction = 0.0;
  AutoScaleConfig as;
  as.marginFraction = config_.pricePaddingFraction;
  autoScale_.setConfig(as);
  clampWindow();
  refresh();
}

double ViewportManager::maxSpan() const {
  double n = static_cast<double>(std::max<std::size_t>(bars_->size(), 1));
  return std::min(config_.maxBars, n);
}

double ViewportManager::minSpan() const {
  return std::min(config_.minBars, maxSpan());
}

void ViewportManager::setWindow(double start, double span) {
  state_.visibleStart = start;
  state_.visibleEnd = start + span;
  clampWindow();
}

void ViewportManager::clampWindow() {
  const double lo = -0.5;
  const double hi = static_cast<double>(std::max<std::size_t>(bars_->size(), 1)) - 0.5;

  double start = state_.visibleStart;
  double span = state_.visibleEnd - state_.visibleStart;
  if (!std::isfinite(start) || !std::isfinite(span)) {
    // Re-anchor on the most recent bars
    span = maxSpan();
    start = hi - span;
  }

  span = std::max(minSpan(), std::min(maxSpan(), span));
  if (start < lo) start = lo;
  if (start + span > hi) start = hi - span;

  state_.visibleStart = start;
  state_.visibleEnd = start + span;
}

void ViewportManager::refresh() {
  std::size_t first = 0, last = 0;
  bool any = visibleBarRange(first, last);

  if (state_.autoScalePrice) {
    double mn = 0.0, mx = 1.0;
    if (!any || !autoScale_.computePriceRange(*bars_, first, last, mn, mx)) {
      mn = 0.0;
      mx = 1.0;
    }
    state_.priceMin = mn;
    state_.priceMax = mx;
  }

  state_.visibleBars = state_.visibleEnd - state_.visibleStart;
  state_.barWidthPx = state_.visibleBars > 0.0
    ? static_cast<double>(state_.widthPx) / state_.visibleBars : 0.0;
  state_.volumeMax = any
    ? AutoScale::maxVolume(*bars_, first, last) * config_.volumeHeadroom : 0.0;

  CoordinateTransform xf = transform();
  double spanMs = xf.indexToTime(state_.visibleEnd) - xf.indexToTime(state_.visibleStart);
  if (spanMs <= kMsPerDay)            state_.timeAxisLevel = TimeAxisLevel::Minute;
  else if (spanMs <= 7 * kMsPerDay)   state_.timeAxisLevel = TimeAxisLevel::Hour;
  else if (spanMs <= 90 * kMsPerDay)  state_.timeAxisLevel = TimeAxisLevel::Day;
  else if (spanMs <= 365 * kMsPerDay) state_.timeAxisLevel = TimeAxisLevel::Month;
  else                                state_.timeAxisLevel = TimeAxisLevel::Year;

  if (rangeListener_) rangeListener_(state_.visibleStart, state_.visibleEnd);

  // Edge requests fire on entering the zone, not on every change inside it.
  if (!bars_->empty()) {
    double n = static_cast<double>(bars_->size());
    bool left = state_.visibleStart < -0.5 + config_.edgeLoadThresholdBars;
    bool right = state_.visibleEnd > n - 0.5 - config_.edgeLoadThresholdBars;
    if (left && !nearLeftEdge_ && edgeListener_) edgeListener_(DataEdge::Left);
    if (right && !nearRightEdge_ && edgeListener_) edgeListener_(DataEdge::Right);
    nearLeftEdge_ = left;
    nearRightEdge_ = right;
  }
}

void ViewportManager::setData(BarSnapshot bars) {
  bool wasEmpty = bars_->empty();
  bars_ = bars ? std::move(bars) : std::make_shared<const BarSeries>();
  nearLeftEdge_ = nearRightEdge_ = false;

  if (wasEmpty && !bars_->empty()) {
    Timeframe tf = state_.timeframe == Timeframe::Custom ? Timeframe::All : state_.timeframe;
    applyTimeframe(tf);
    return;
  }

  clampWindow();
  refresh();
}

void ViewportManager::setCanvasSize(int widthPx, int heightPx) {
  state_.widthPx = std::max(widthPx, 1);
  state_.heightPx = std::max(heightPx, 1);
  state_.barWidthPx = state_.visibleBars > 0.0
    ? static_cast<double>(state_.widthPx) / state_.visibleBars : 0.0;
}

bool ViewportManager::applyTimeframe(Timeframe tf) {
  const std::size_t n = bars_->size();
  double count = 0.0;
  switch (tf) {
    case Timeframe::OneDay:      count = 1; break;
    case Timeframe::FiveDays:    count = 5; break;
    case Timeframe::OneMonth:    count = 22; break;
    case Timeframe::ThreeMonths: count = 66; break;
    case Timeframe::SixMonths:   count = 132; break;
    case Timeframe::OneYear:     count = 252; break;
    case Timeframe::FiveYears:   count = 1260; break;
    case Timeframe::All:         count = static_cast<double>(n); break;
    case Timeframe::YearToDate: {
      if (n > 0) {
        std::int64_t yearStart = startOfUtcYearMs(bars_->back().timestamp);
        auto it = std::lower_bound(bars_->begin(), bars_->end(), yearStart,
          [](const Bar& b, std::int64_t t) { return b.timestamp < t; });
        count = static_cast<double>(bars_->end() - it);
      }
      break;
    }
    case Timeframe::Custom:
      return false;
  }

  double hi = static_cast<double>(std::max<std::size_t>(n, 1)) - 0.5;
  double span = std::max(minSpan(), std::min(maxSpan(), count));
  state_.timeframe = tf;
  state_.autoScalePrice = true;
  setWindow(hi - span, span);
  refresh();
  return true;
}

bool ViewportManager::applyTimeframe(const std::string& period) {
  Timeframe tf;
  if (!parseTimeframe(period, tf)) return false;
  return applyTimeframe(tf);
}

void ViewportManager::panBy(double deltaBars) {
  if (!std::isfinite(deltaBars) || deltaBars == 0.0) return;
  double span = state_.visibleEnd - state_.visibleStart;
  setWindow(state_.visibleStart + deltaBars, span);
  state_.timeframe = Timeframe::Custom;
  refresh();
}

void ViewportManager::panByPixels(double dxPixels) {
  double ppb = transform().pixelsPerBar();
  if (ppb <= 0.0) return;
  panBy(-dxPixels / ppb);
}

void ViewportManager::wheelZoom(double pixelX, double deltaY) {
  if (!std::isfinite(pixelX) || !std::isfinite(deltaY)) return;
  zoomAt(std::exp(-deltaY * config_.zoomSensitivity), pixelX);
}

void ViewportManager::zoomAt(double factor, double anchorX) {
  if (!(factor > 0.0) || !std::isfinite(factor)) return;
  double w = static_cast<double>(state_.widthPx);
  double anchorIndex = transform().xToIndex(anchorX);
  double ratio = w > 0.0 ? anchorX / w : 0.5;

  double span = (state_.visibleEnd - state_.visibleStart) / factor;
  span = std::max(minSpan(), std::min(maxSpan(), span));

  setWindow(anchorIndex - ratio * span, span);
  state_.timeframe = Timeframe::Custom;
  refresh();
}

void ViewportManager::setVisibleRange(double start, double end) {
  if (!std::isfinite(start) || !std::isfinite(end)) return;
  if (end < start) std::swap(start, end);
  setWindow(start, end - start);
  state_.timeframe = Timeframe::Custom;
  refresh();
}

void ViewportManager::showAll() {
  applyTimeframe(Timeframe::All);
}

void ViewportManager::scrollToLatest() {
  double span = state_.visibleEnd - state_.visibleStart;
  double hi = static_cast<double>(std::max<std::size_t>(bars_->size(), 1)) - 0.5;
  setWindow(hi - span, span);
  refresh();
}

void ViewportManager::setPriceRange(double priceMin, double priceMax) {
  if (!std::isfinite(priceMin) || !std::isfinite(priceMax)) return;
  if (priceMax < priceMin) std::swap(priceMin, priceMax);
  if (priceMax - priceMin <= 0.0) {
    double pad = std::max(std::fabs(priceMax) * 0.01, 1.0);
    priceMin -= pad;
    priceMax += pad;
  }
  state_.autoScalePrice = false;
  state_.priceMin = priceMin;
  state_.priceMax = priceMax;
}

void ViewportManager::fitPriceToVisible() {
  state_.autoScalePrice = true;
  refresh();
}

CoordinateTransform ViewportManager::transform() const {
  return CoordinateTransform(state_, bars_, config_.defaultBarIntervalMs);
}

bool ViewportManager::visibleBarRange(std::size_t& first, std::size_t& last) const {
  if (bars_->empty()) return false;
  // Bar i covers [i - 0.5, i + 0.5)
  double f = std::floor(state_.visibleStart + 0.5);
  double l = std::ceil(state_.visibleEnd - 0.5);
  double maxIndex = static_cast<double>(bars_->size() - 1);
  f = std::max(0.0, f);
  l = std::min(maxIndex, l);
  if (f > l) return false;
  first = static_cast<std::size_t>(f);
  last = static_cast<std::size_t>(l);
  return true;
}

} // namespace tc
