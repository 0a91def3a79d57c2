#include "tc/drawing/tools/ShapeTools.hpp"

#include <algorithm>
#include <cmath>

namespace tc {

static constexpr double kTwoPi = 6.28318530717958647692;

static DrawingObject filledShapeStart(const DrawingTool& tool, const WorldPoint& p,
                                      const DrawingStyle& baseStyle) {
  DrawingObject obj = tool.DrawingTool::onStart(p, baseStyle);
  if (obj.style.fillColor.empty()) obj.style.fillColor = obj.style.color;
  obj.style.opacity = 0.1;
  return obj;
}

// Outline is opaque regardless of the fill opacity.
static void applyOutline(RenderContext& rc, const DrawingStyle& style) {
  DrawingStyle outline = style;
  outline.opacity = 1.0;
  applyStrokeStyle(rc, outline);
}

// ---- Rectangle ----

DrawingObject RectangleTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  return filledShapeStart(*this, p, baseStyle);
}

void RectangleTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  double x = std::min(a.x, b.x), y = std::min(a.y, b.y);
  double w = std::fabs(b.x - a.x), h = std::fabs(b.y - a.y);

  rc.sink.save();
  if (!obj.style.fillColor.empty()) {
    applyFill(rc, obj.style.fillColor, obj.style.opacity);
    rc.sink.beginPath();
    rc.sink.rect(x, y, w, h);
    rc.sink.fill();
  }
  applyOutline(rc, obj.style);
  rc.sink.beginPath();
  rc.sink.rect(x, y, w, h);
  rc.sink.stroke();
  rc.sink.restore();
}

double RectangleTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                              const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  return pointToRectDistance(xf.worldToScreen(p),
                             xf.worldToScreen(obj.points[0]),
                             xf.worldToScreen(obj.points[1]));
}

// ---- Ellipse ----

DrawingObject EllipseTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  return filledShapeStart(*this, p, baseStyle);
}

void EllipseTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.size() < 2) return;
  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  double cx = (a.x + b.x) * 0.5, cy = (a.y + b.y) * 0.5;
  double rx = std::fabs(b.x - a.x) * 0.5, ry = std::fabs(b.y - a.y) * 0.5;

  rc.sink.save();
  if (!obj.style.fillColor.empty()) {
    applyFill(rc, obj.style.fillColor, obj.style.opacity);
    rc.sink.beginPath();
    rc.sink.ellipse(cx, cy, rx, ry, 0.0, 0.0, kTwoPi);
    rc.sink.fill();
  }
  applyOutline(rc, obj.style);
  rc.sink.beginPath();
  rc.sink.ellipse(cx, cy, rx, ry, 0.0, 0.0, kTwoPi);
  rc.sink.stroke();
  rc.sink.restore();
}

double EllipseTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                            const CoordinateTransform& xf) const {
  if (obj.points.size() < 2) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);
  double rx = std::fabs(b.x - a.x) * 0.5, ry = std::fabs(b.y - a.y) * 0.5;

  // Collapsed to a line (or a point)
  if (rx <= 0.0 || ry <= 0.0) return pointToSegmentDistance(s, a, b);

  double cx = (a.x + b.x) * 0.5, cy = (a.y + b.y) * 0.5;
  double nx = (s.x - cx) / rx, ny = (s.y - cy) / ry;
  double norm = std::sqrt(nx * nx + ny * ny);
  if (norm <= 1.0) return 0.0;
  return (norm - 1.0) * std::min(rx, ry);
}

} // namespace tc
