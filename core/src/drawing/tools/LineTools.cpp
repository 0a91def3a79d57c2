#include "tc/drawing/tools/LineTools.hpp"

#include <cmath>
#include <cstdio>

namespace tc {

// Optional caption along a line: meta.showText + meta.lineText.
static void drawLineText(RenderContext& rc, const DrawingObject& obj,
                         const ScreenPoint& a, const ScreenPoint& b) {
  auto it = obj.meta.find("showText");
  if (it == obj.meta.end() || it->second.kind != MetaValue::Kind::Flag || !it->second.flag)
    return;
  std::string text = obj.metaText("lineText");
  if (text.empty()) return;

  applyFill(rc, obj.style.color, 1.0);
  rc.sink.setFont(12.0, obj.style.fontFamily, "normal");
  rc.sink.setTextAlign(TextAlign::Center);
  rc.sink.fillText(text, (a.x + b.x) * 0.5, (a.y + b.y) * 0.5 - 20.0);
}

static std::string formatPrice(double price) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", price);
  return buf;
}

// ---- Trendline ----

DrawingObject TrendlineTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.meta["showText"] = MetaValue::ofFlag(false);
  obj.meta["lineText"] = MetaValue::ofText("");
  return obj;
}

void TrendlineTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, a, b);
  drawLineText(rc, obj, a, b);
  rc.sink.restore();
}

double TrendlineTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                              const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  return pointToSegmentDistance(xf.worldToScreen(p),
                                xf.worldToScreen(obj.points[0]),
                                xf.worldToScreen(obj.points[1]));
}

// ---- Horizontal line ----

void HorizontalLineTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.empty()) return;
  double y = rc.xf.priceToY(obj.points[0].p);

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, ScreenPoint{0.0, y}, ScreenPoint{rc.xf.width(), y});

  applyFill(rc, obj.style.color, 1.0);
  drawLabel(rc, obj.style, formatPrice(obj.points[0].p), rc.xf.width() - 5.0, y - 4.0,
            TextAlign::Right);
  rc.sink.restore();
}

double HorizontalLineTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                   const CoordinateTransform& xf) const {
  if (obj.points.empty()) return kNoHit;
  return std::fabs(xf.priceToY(p.p) - xf.priceToY(obj.points[0].p));
}

// ---- Vertical line ----

DrawingObject VerticalLineTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.paneId = PaneId::Full;
  return obj;
}

void VerticalLineTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.empty()) return;
  double x = rc.xf.timeToX(obj.points[0].t);

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, ScreenPoint{x, 0.0}, ScreenPoint{x, rc.xf.height()});
  rc.sink.restore();
}

double VerticalLineTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                 const CoordinateTransform& xf) const {
  if (obj.points.empty()) return kNoHit;
  return std::fabs(xf.timeToX(p.t) - xf.timeToX(obj.points[0].t));
}

// ---- Ray ----

void RayTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  ScreenPoint end = extendRayToBounds(a, b, rc.xf.width(), rc.xf.height());

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, a, end);
  drawLineText(rc, obj, a, b);
  rc.sink.restore();
}

double RayTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                        const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  return pointToRayDistance(xf.worldToScreen(p),
                            xf.worldToScreen(obj.points[0]),
                            xf.worldToScreen(obj.points[1]));
}

// ---- Arrow ----

void ArrowTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, a, b);

  double angle = std::atan2(b.y - a.y, b.x - a.x);
  applyFill(rc, obj.style.color, obj.style.opacity);
  rc.sink.beginPath();
  rc.sink.moveTo(b.x, b.y);
  rc.sink.lineTo(b.x - kHeadLength * std::cos(angle - kHeadAngle),
                 b.y - kHeadLength * std::sin(angle - kHeadAngle));
  rc.sink.lineTo(b.x - kHeadLength * std::cos(angle + kHeadAngle),
                 b.y - kHeadLength * std::sin(angle + kHeadAngle));
  rc.sink.closePath();
  rc.sink.fill();
  rc.sink.restore();
}

double ArrowTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                          const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  return pointToSegmentDistance(xf.worldToScreen(p),
                                xf.worldToScreen(obj.points[0]),
                                xf.worldToScreen(obj.points[1]));
}

} // namespace tc
