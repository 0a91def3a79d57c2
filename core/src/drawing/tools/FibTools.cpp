#include "tc/drawing/tools/FibTools.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace tc {

static const char* const kFibColors[] = {
  "#6B7280", "#EF4444", "#F59E0B", "#10B981", "#3B82F6", "#8B5CF6", "#6B7280"
};
static constexpr std::size_t kFibColorCount = sizeof(kFibColors) / sizeof(kFibColors[0]);

static const char* const kExtensionColors[] = {
  "#6B7280", "#EF4444", "#F59E0B", "#10B981", "#3B82F6",
  "#8B5CF6", "#EC4899", "#F97316", "#84CC16", "#06B6D4"
};
static constexpr std::size_t kExtensionColorCount =
  sizeof(kExtensionColors) / sizeof(kExtensionColors[0]);

static const char* const kLevelsKey = "fibLevels";

static std::vector<double> levelsOf(const DrawingObject& obj, const std::vector<double>& fallback) {
  std::vector<double> levels = obj.metaNumbers(kLevelsKey);
  return levels.empty() ? fallback : levels;
}

static void levelStroke(RenderContext& rc, const char* color, const std::vector<double>& dash) {
  DrawingStyle s;
  s.color = color;
  s.lineWidth = 1.0;
  applyStrokeStyle(rc, s);
  rc.sink.setLineDash(dash);
}

// ---- Retracement ----

const std::vector<double>& FibRetracementTool::defaultLevels() {
  static const std::vector<double> levels = {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};
  return levels;
}

DrawingObject FibRetracementTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.meta[kLevelsKey] = MetaValue::ofNumbers(defaultLevels());
  return obj;
}

void FibRetracementTool::onComplete(DrawingObject& obj) const {
  std::vector<double> levels = levelsOf(obj, defaultLevels());
  std::sort(levels.begin(), levels.end());
  levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
  obj.meta[kLevelsKey] = MetaValue::ofNumbers(levels);
}

std::vector<double> FibRetracementTool::levelPrices(const DrawingObject& obj) {
  std::vector<double> prices;
  if (obj.points.size() < 2) return prices;
  double p0 = obj.points[0].p, p1 = obj.points[1].p;
  for (double level : levelsOf(obj, defaultLevels()))
    prices.push_back(p0 + (p1 - p0) * level);
  return prices;
}

void FibRetracementTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  double minX = std::min(a.x, b.x), maxX = std::max(a.x, b.x);

  std::vector<double> levels = levelsOf(obj, defaultLevels());
  std::vector<double> prices = levelPrices(obj);

  rc.sink.save();
  for (std::size_t i = 0; i < levels.size(); ++i) {
    const char* color = i < kFibColorCount ? kFibColors[i] : obj.style.color.c_str();
    double y = a.y + (b.y - a.y) * levels[i];

    levelStroke(rc, color, {3.0, 3.0});
    strokeSegment(rc.sink, ScreenPoint{minX, y}, ScreenPoint{maxX, y});

    char pct[32];
    std::snprintf(pct, sizeof(pct), "%.1f%%", levels[i] * 100.0);
    char price[32];
    std::snprintf(price, sizeof(price), "%.2f", prices[i]);

    applyFill(rc, color, 1.0);
    drawLabel(rc, obj.style, pct, maxX + 5.0, y + 3.0, TextAlign::Left);
    drawLabel(rc, obj.style, price, minX - 5.0, y + 3.0, TextAlign::Right);
  }
  rc.sink.restore();
}

double FibRetracementTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                   const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);
  double minX = std::min(a.x, b.x), maxX = std::max(a.x, b.x);

  double best = kNoHit;
  for (double level : levelsOf(obj, defaultLevels())) {
    double y = a.y + (b.y - a.y) * level;
    best = std::min(best, pointToSegmentDistance(s, ScreenPoint{minX, y}, ScreenPoint{maxX, y}));
  }
  return best;
}

// ---- Extension ----

const std::vector<double>& FibExtensionTool::defaultLevels() {
  static const std::vector<double> levels = {
    0.0, 0.618, 1.0, 1.272, 1.414, 1.618, 2.0, 2.618, 3.618, 4.236
  };
  return levels;
}

DrawingObject FibExtensionTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.meta[kLevelsKey] = MetaValue::ofNumbers(defaultLevels());
  return obj;
}

void FibExtensionTool::onComplete(DrawingObject& obj) const {
  if (obj.metaNumbers(kLevelsKey).empty())
    obj.meta[kLevelsKey] = MetaValue::ofNumbers(defaultLevels());
}

std::vector<double> FibExtensionTool::targetPrices(const DrawingObject& obj) {
  std::vector<double> prices;
  if (obj.points.size() < 3) return prices;
  double swing = obj.points[1].p - obj.points[0].p;
  double base = obj.points[2].p;
  for (double level : levelsOf(obj, defaultLevels()))
    prices.push_back(base + swing * level);
  return prices;
}

void FibExtensionTool::render(const DrawingObject& obj, RenderContext& rc) const {
  // While drafting show the swing leg
  if (obj.points.size() == 2) {
    rc.sink.save();
    applyStrokeStyle(rc, obj.style);
    strokeSegment(rc.sink, rc.xf.worldToScreen(obj.points[0]), rc.xf.worldToScreen(obj.points[1]));
    rc.sink.restore();
    return;
  }
  if (obj.points.size() < 3) return;

  std::vector<double> levels = levelsOf(obj, defaultLevels());
  std::vector<double> prices = targetPrices(obj);
  double w = rc.xf.width();

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  ScreenPoint legs[3] = {
    rc.xf.worldToScreen(obj.points[0]),
    rc.xf.worldToScreen(obj.points[1]),
    rc.xf.worldToScreen(obj.points[2])
  };
  strokePolyline(rc.sink, legs, 3);

  for (std::size_t i = 0; i < levels.size(); ++i) {
    const char* color = i < kExtensionColorCount ? kExtensionColors[i] : obj.style.color.c_str();
    double y = rc.xf.priceToY(prices[i]);

    levelStroke(rc, color, {2.0, 4.0});
    strokeSegment(rc.sink, ScreenPoint{0.0, y}, ScreenPoint{w, y});

    char ratio[32];
    std::snprintf(ratio, sizeof(ratio), "%.3f", levels[i]);
    char price[32];
    std::snprintf(price, sizeof(price), "%.2f", prices[i]);

    applyFill(rc, color, 1.0);
    drawLabel(rc, obj.style, ratio, w - 5.0, y - 5.0, TextAlign::Right);
    drawLabel(rc, obj.style, price, 5.0, y - 5.0, TextAlign::Left);
  }
  rc.sink.restore();
}

double FibExtensionTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                 const CoordinateTransform& xf) const {
  if (obj.points.size() < 3) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);

  double best = kNoHit;
  for (double price : targetPrices(obj))
    best = std::min(best, std::fabs(s.y - xf.priceToY(price)));

  // The ABC legs are part of the drawing too
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);
  ScreenPoint c = xf.worldToScreen(obj.points[2]);
  best = std::min(best, pointToSegmentDistance(s, a, b));
  best = std::min(best, pointToSegmentDistance(s, b, c));
  return best;
}

} // namespace tc
