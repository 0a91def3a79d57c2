#include "tc/render/ChartRenderer.hpp"
#include "tc/math/Indicators.hpp"
#include "tc/math/NiceTicks.hpp"
#include "tc/math/NiceTimeTicks.hpp"
#include "tc/math/TimeFormat.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace tc {

static void copyColor(const float src[4], float dst[4]) {
  for (int i = 0; i < 4; ++i) dst[i] = src[i];
}

// Decimal places needed to tell adjacent price ticks apart.
static int priceDecimals(double step) {
  if (!(step > 0.0)) return 2;
  int d = static_cast<int>(std::ceil(-std::log10(step)));
  return std::max(0, std::min(8, d));
}

void ChartRenderer::addStandardOverlays(const BarSeries& bars) {
  OverlayLine sma;
  sma.label = "SMA 20";
  sma.values = computeSma(bars, 20);
  copyColor(theme_.overlayColors[0], sma.color);
  overlays_.push_back(sma);

  OverlayLine ema;
  ema.label = "EMA 50";
  ema.values = computeEma(bars, 50);
  copyColor(theme_.overlayColors[1], ema.color);
  overlays_.push_back(ema);

  BollingerBands bb = computeBollinger(bars, 20, 2.0);
  OverlayLine upper;
  upper.label = "BB upper";
  upper.values = bb.upper;
  upper.lineWidth = 1.0;
  copyColor(theme_.overlayColors[2], upper.color);
  overlays_.push_back(upper);

  OverlayLine lower = upper;
  lower.label = "BB lower";
  lower.values = bb.lower;
  overlays_.push_back(lower);
}

bool ChartRenderer::visibleIndices(const CoordinateTransform& xf,
                                   std::size_t& first, std::size_t& last) {
  const BarSeries& bars = xf.bars();
  if (bars.empty()) return false;
  double lo = std::ceil(xf.state().visibleStart - 0.5);
  double hi = std::floor(xf.state().visibleEnd + 0.5);
  double maxIndex = static_cast<double>(bars.size() - 1);
  lo = std::max(0.0, lo);
  hi = std::min(maxIndex, hi);
  if (hi < lo) return false;
  first = static_cast<std::size_t>(lo);
  last = static_cast<std::size_t>(hi);
  return true;
}

void ChartRenderer::render(RenderSink& sink, const CoordinateTransform& xf) const {
  renderBackground(sink, xf);
  if (config_.showGrid) renderGrid(sink, xf);
  if (config_.showVolume) renderVolume(sink, xf);
  renderCandles(sink, xf);
  renderOverlays(sink, xf);
}

void ChartRenderer::renderBackground(RenderSink& sink, const CoordinateTransform& xf) const {
  sink.save();
  sink.setFillColor(theme_.backgroundColor);
  sink.beginPath();
  sink.rect(0.0, 0.0, xf.width(), xf.height());
  sink.fill();
  sink.restore();
}

void ChartRenderer::renderGrid(RenderSink& sink, const CoordinateTransform& xf) const {
  const ViewportState& st = xf.state();
  double w = xf.width();
  double h = xf.height();

  sink.save();
  sink.setStrokeColor(theme_.gridColor);
  sink.setLineWidth(theme_.gridLineWidth);
  sink.setLineDash({});
  sink.setFillColor(theme_.labelColor);
  sink.setFont(config_.labelFontSize, config_.fontFamily, "normal");

  // Horizontal lines at nice price levels, labels on the right edge
  TickSet py = computeNiceTicks(st.priceMin, st.priceMax, config_.priceTickTarget);
  int decimals = priceDecimals(py.step);
  sink.setTextAlign(TextAlign::Right);
  for (double v : py.values) {
    double y = xf.priceToY(v);
    if (y < 0.0 || y > h) continue;
    sink.beginPath();
    sink.moveTo(0.0, y);
    sink.lineTo(w, y);
    sink.stroke();

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    sink.fillText(buf, w - 4.0, y - 2.0);
  }

  // Vertical lines at calendar-aligned times, labels along the bottom
  if (!xf.bars().empty()) {
    double tMin = xf.indexToTime(st.visibleStart);
    double tMax = xf.indexToTime(st.visibleEnd);
    if (std::isfinite(tMin) && std::isfinite(tMax) && tMax > tMin) {
      TimeTickSet tt = computeNiceTimeTicks(static_cast<std::int64_t>(tMin),
                                            static_cast<std::int64_t>(tMax),
                                            config_.timeTickTarget);
      const char* fmt = chooseTimeFormat(tt.stepSeconds);
      sink.setTextAlign(TextAlign::Center);
      for (std::int64_t t : tt.values) {
        double x = xf.timeToX(static_cast<double>(t));
        if (x < 0.0 || x > w) continue;
        sink.beginPath();
        sink.moveTo(x, 0.0);
        sink.lineTo(x, h);
        sink.stroke();
        sink.fillText(formatTimestampMs(t, fmt), x, h - 4.0);
      }
    }
  }
  sink.restore();
}

void ChartRenderer::renderVolume(RenderSink& sink, const CoordinateTransform& xf) const {
  double volumeMax = xf.state().volumeMax;
  if (!(volumeMax > 0.0)) return;
  std::size_t first = 0, last = 0;
  if (!visibleIndices(xf, first, last)) return;

  const BarSeries& bars = xf.bars();
  double h = xf.height();
  double paneH = h * config_.volumePaneFraction;
  double barW = std::max(1.0, xf.pixelsPerBar() * config_.candleBodyFraction);

  sink.save();
  for (int pass = 0; pass < 2; ++pass) {
    bool up = pass == 0;
    sink.setFillColor(up ? theme_.volumeUp : theme_.volumeDown);
    sink.beginPath();
    for (std::size_t i = first; i <= last; ++i) {
      const Bar& b = bars[i];
      if ((b.close >= b.open) != up) continue;
      double barH = std::min(b.volume / volumeMax, 1.0) * paneH;
      if (barH <= 0.0) continue;
      double x = xf.indexToX(static_cast<double>(i));
      sink.rect(x - barW * 0.5, h - barH, barW, barH);
    }
    sink.fill();
  }
  sink.restore();
}

void ChartRenderer::renderCandles(RenderSink& sink, const CoordinateTransform& xf) const {
  std::size_t first = 0, last = 0;
  if (!visibleIndices(xf, first, last)) return;

  const BarSeries& bars = xf.bars();
  double bodyW = std::max(1.0, xf.pixelsPerBar() * config_.candleBodyFraction);

  sink.save();
  sink.setLineWidth(1.0);
  sink.setLineDash({});
  // Up candles first, then down, so each colour is set once per frame
  for (int pass = 0; pass < 2; ++pass) {
    bool up = pass == 0;
    const float* color = up ? theme_.candleUp : theme_.candleDown;
    sink.setStrokeColor(color);
    sink.setFillColor(color);

    sink.beginPath();
    for (std::size_t i = first; i <= last; ++i) {
      const Bar& b = bars[i];
      if ((b.close >= b.open) != up) continue;
      double x = xf.indexToX(static_cast<double>(i));
      sink.moveTo(x, xf.priceToY(b.high));
      sink.lineTo(x, xf.priceToY(b.low));
    }
    sink.stroke();

    sink.beginPath();
    for (std::size_t i = first; i <= last; ++i) {
      const Bar& b = bars[i];
      if ((b.close >= b.open) != up) continue;
      double x = xf.indexToX(static_cast<double>(i));
      double yTop = xf.priceToY(std::max(b.open, b.close));
      double yBot = xf.priceToY(std::min(b.open, b.close));
      double bodyH = std::max(1.0, yBot - yTop);
      sink.rect(x - bodyW * 0.5, yTop, bodyW, bodyH);
    }
    sink.fill();
  }
  sink.restore();
}

void ChartRenderer::renderOverlays(RenderSink& sink, const CoordinateTransform& xf) const {
  std::size_t first = 0, last = 0;
  if (overlays_.empty() || !visibleIndices(xf, first, last)) return;

  sink.save();
  sink.setLineDash({});
  for (const auto& line : overlays_) {
    sink.setStrokeColor(line.color);
    sink.setLineWidth(line.lineWidth);
    sink.beginPath();
    bool penDown = false;
    std::size_t end = std::min(last + 1, line.values.size());
    for (std::size_t i = first; i < end; ++i) {
      double v = line.values[i];
      if (!std::isfinite(v)) {
        penDown = false;
        continue;
      }
      double x = xf.indexToX(static_cast<double>(i));
      double y = xf.priceToY(v);
      if (penDown) {
        sink.lineTo(x, y);
      } else {
        sink.moveTo(x, y);
        penDown = true;
      }
    }
    sink.stroke();
  }
  sink.restore();
}

} // namespace tc
