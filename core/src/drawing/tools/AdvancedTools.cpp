#include "tc/drawing/tools/AdvancedTools.hpp"
#include "tc/math/Indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace tc {

// ---- Gann fan ----

const std::vector<double>& GannFanTool::defaultRatios() {
  static const std::vector<double> ratios = {
    1.0 / 8.0, 1.0 / 4.0, 1.0 / 3.0, 1.0 / 2.0, 1.0, 2.0, 3.0, 4.0, 8.0
  };
  return ratios;
}

DrawingObject GannFanTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.meta["angles"] = MetaValue::ofNumbers(defaultRatios());
  return obj;
}

static std::vector<double> gannRatios(const DrawingObject& obj) {
  std::vector<double> ratios = obj.metaNumbers("angles");
  return ratios.empty() ? GannFanTool::defaultRatios() : ratios;
}

// Unit direction of the ray for one ratio; y follows the p0->p1 sense.
static ScreenPoint gannDirection(double ratio, const ScreenPoint& a, const ScreenPoint& b) {
  double angle = std::atan(ratio);
  double sign = b.y > a.y ? 1.0 : -1.0;
  return ScreenPoint{std::cos(angle), std::sin(angle) * sign};
}

static std::string formatRatio(double ratio) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "1:%g", ratio);
  return buf;
}

void GannFanTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  double reach = rc.xf.width();

  DrawingStyle rayStyle = obj.style;
  rayStyle.lineWidth = 1.0;
  rayStyle.opacity = 0.7;

  rc.sink.save();
  for (double ratio : gannRatios(obj)) {
    ScreenPoint dir = gannDirection(ratio, a, b);

    applyStrokeStyle(rc, rayStyle);
    if (ratio == 1.0)
      rc.sink.setLineDash({});
    else
      rc.sink.setLineDash({3.0, 3.0});
    strokeSegment(rc.sink, a, ScreenPoint{a.x + dir.x * reach, a.y + dir.y * reach});

    applyFill(rc, obj.style.color, 0.7);
    drawLabel(rc, obj.style, formatRatio(ratio), a.x + dir.x * 100.0, a.y + dir.y * 100.0,
              TextAlign::Left);
  }
  rc.sink.restore();
}

double GannFanTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                            const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);

  double best = kNoHit;
  for (double ratio : gannRatios(obj)) {
    ScreenPoint dir = gannDirection(ratio, a, b);
    best = std::min(best, pointToRayDistance(s, a, ScreenPoint{a.x + dir.x, a.y + dir.y}));
  }
  return best;
}

// ---- Volume profile ----

DrawingObject VolumeProfileTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  if (obj.style.fillColor.empty()) obj.style.fillColor = "#10B981";
  obj.style.opacity = 0.6;
  obj.meta["bins"] = MetaValue::ofNumber(kDefaultBins);
  obj.meta["showPOC"] = MetaValue::ofFlag(true);
  obj.meta["showValueArea"] = MetaValue::ofFlag(true);
  return obj;
}

int VolumeProfileTool::binCount(const DrawingObject& obj) {
  double v = obj.metaNumber("bins", kDefaultBins);
  if (!std::isfinite(v)) return kDefaultBins;
  if (v < 1.0) return 1;
  if (v > kMaxBins) return kMaxBins;
  return static_cast<int>(v);
}

static bool metaFlag(const DrawingObject& obj, const char* key, bool fallback) {
  auto it = obj.meta.find(key);
  if (it == obj.meta.end() || it->second.kind != MetaValue::Kind::Flag) return fallback;
  return it->second.flag;
}

void VolumeProfileTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  const WorldPoint& w0 = obj.points[0];
  const WorldPoint& w1 = obj.points[1];

  int bins = binCount(obj);

  VolumeProfile vp = computeVolumeProfile(rc.xf.bars(), std::min(w0.t, w1.t), std::max(w0.t, w1.t),
                                          std::min(w0.p, w1.p), std::max(w0.p, w1.p), bins);

  ScreenPoint a = rc.xf.worldToScreen(w0);
  ScreenPoint b = rc.xf.worldToScreen(w1);
  double left = std::max(a.x, b.x);

  rc.sink.save();

  // Outline of the sampled range
  DrawingStyle outline = obj.style;
  outline.opacity = 1.0;
  outline.lineWidth = 1.0;
  outline.lineStyle = LineStyle::Dashed;
  applyStrokeStyle(rc, outline);
  rc.sink.beginPath();
  rc.sink.rect(std::min(a.x, b.x), std::min(a.y, b.y), std::fabs(b.x - a.x), std::fabs(b.y - a.y));
  rc.sink.stroke();

  if (vp.pocBin < 0) {
    rc.sink.restore();
    return;
  }

  double maxVol = vp.binVolume[static_cast<std::size_t>(vp.pocBin)];
  bool showPoc = metaFlag(obj, "showPOC", true);
  bool showValueArea = metaFlag(obj, "showValueArea", true);
  double binSpan = (vp.priceMax - vp.priceMin) / bins;

  for (int i = 0; i < bins; ++i) {
    double vol = vp.binVolume[static_cast<std::size_t>(i)];
    if (vol <= 0.0) continue;
    double yTop = rc.xf.priceToY(vp.priceMin + binSpan * (i + 1));
    double yBot = rc.xf.priceToY(vp.priceMin + binSpan * i);
    double barW = vol / maxVol * kMaxBarWidthPx;

    double opacity = obj.style.opacity;
    if (showValueArea && (i < vp.valueAreaLow || i > vp.valueAreaHigh)) opacity *= 0.5;
    const std::string& color = (showPoc && i == vp.pocBin) ? obj.style.color : obj.style.fillColor;

    applyFill(rc, color, opacity);
    rc.sink.beginPath();
    rc.sink.rect(left, yTop, barW, std::max(1.0, std::fabs(yBot - yTop) - 1.0));
    rc.sink.fill();
  }

  if (showPoc) {
    double pocPrice = vp.priceMin + binSpan * (vp.pocBin + 0.5);
    double y = rc.xf.priceToY(pocPrice);
    applyStrokeStyle(rc, outline);
    rc.sink.setLineDash({});
    strokeSegment(rc.sink, ScreenPoint{std::min(a.x, b.x), y}, ScreenPoint{left + kMaxBarWidthPx, y});

    char buf[32];
    std::snprintf(buf, sizeof(buf), "POC %.2f", pocPrice);
    applyFill(rc, obj.style.color, 1.0);
    drawLabel(rc, obj.style, buf, left + kMaxBarWidthPx + 4.0, y + 3.0, TextAlign::Left);
  }
  rc.sink.restore();
}

double VolumeProfileTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                  const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);
  // Histogram bars extend past the box
  ScreenPoint lo{std::min(a.x, b.x), std::min(a.y, b.y)};
  ScreenPoint hi{std::max(a.x, b.x) + kMaxBarWidthPx, std::max(a.y, b.y)};
  return pointToRectDistance(xf.worldToScreen(p), lo, hi);
}

} // namespace tc
