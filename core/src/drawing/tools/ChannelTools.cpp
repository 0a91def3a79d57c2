#include "tc/drawing/tools/ChannelTools.hpp"

#include <algorithm>

namespace tc {

// Both channel tools draw only the base leg until the third point lands.
static bool drawDraftLeg(const DrawingObject& obj, RenderContext& rc) {
  if (obj.points.size() != 2) return false;
  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  strokeSegment(rc.sink, rc.xf.worldToScreen(obj.points[0]), rc.xf.worldToScreen(obj.points[1]));
  rc.sink.restore();
  return true;
}

// ---- Parallel channel ----

DrawingObject ParallelChannelTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  if (obj.style.fillColor.empty()) obj.style.fillColor = "#0EA5E9";
  obj.style.opacity = 0.1;
  return obj;
}

WorldPoint ParallelChannelTool::oppositeCorner(const DrawingObject& obj) {
  if (obj.points.size() < 3) return WorldPoint{};
  const WorldPoint& a = obj.points[0];
  const WorldPoint& b = obj.points[1];
  const WorldPoint& c = obj.points[2];
  return WorldPoint{c.t + (b.t - a.t), c.p + (b.p - a.p)};
}

void ParallelChannelTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (drawDraftLeg(obj, rc)) return;
  if (obj.points.size() < 3) return;

  ScreenPoint a = rc.xf.worldToScreen(obj.points[0]);
  ScreenPoint b = rc.xf.worldToScreen(obj.points[1]);
  ScreenPoint c = rc.xf.worldToScreen(obj.points[2]);
  ScreenPoint d = rc.xf.worldToScreen(oppositeCorner(obj));

  rc.sink.save();
  if (!obj.style.fillColor.empty()) {
    applyFill(rc, obj.style.fillColor, obj.style.opacity);
    rc.sink.beginPath();
    rc.sink.moveTo(a.x, a.y);
    rc.sink.lineTo(b.x, b.y);
    rc.sink.lineTo(d.x, d.y);
    rc.sink.lineTo(c.x, c.y);
    rc.sink.closePath();
    rc.sink.fill();
  }

  DrawingStyle outline = obj.style;
  outline.opacity = 1.0;
  applyStrokeStyle(rc, outline);
  strokeSegment(rc.sink, a, b);
  strokeSegment(rc.sink, c, d);
  rc.sink.restore();
}

double ParallelChannelTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                                    const CoordinateTransform& xf) const {
  if (obj.points.size() < 3) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);
  ScreenPoint a = xf.worldToScreen(obj.points[0]);
  ScreenPoint b = xf.worldToScreen(obj.points[1]);
  ScreenPoint c = xf.worldToScreen(obj.points[2]);
  ScreenPoint d = xf.worldToScreen(oppositeCorner(obj));
  return std::min(pointToSegmentDistance(s, a, b), pointToSegmentDistance(s, c, d));
}

// ---- Pitchfork ----

namespace {

struct Fork {
  ScreenPoint handle, upper, lower;
  ScreenPoint medianEnd, upperEnd, lowerEnd;
};

Fork computeFork(const CoordinateTransform& xf, const DrawingObject& obj) {
  Fork f;
  f.handle = xf.worldToScreen(obj.points[0]);
  f.upper = xf.worldToScreen(obj.points[1]);
  f.lower = xf.worldToScreen(obj.points[2]);

  ScreenPoint mid{(f.upper.x + f.lower.x) * 0.5, (f.upper.y + f.lower.y) * 0.5};
  double dx = mid.x - f.handle.x, dy = mid.y - f.handle.y;

  f.medianEnd = ScreenPoint{mid.x + dx * 2.0, mid.y + dy * 2.0};
  f.upperEnd = ScreenPoint{f.upper.x + dx, f.upper.y + dy};
  f.lowerEnd = ScreenPoint{f.lower.x + dx, f.lower.y + dy};
  return f;
}

} // namespace

void PitchforkTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (drawDraftLeg(obj, rc)) return;
  if (obj.points.size() < 3) return;

  Fork f = computeFork(rc.xf, obj);

  rc.sink.save();
  applyStrokeStyle(rc, obj.style);
  rc.sink.setLineDash({3.0, 3.0});
  strokeSegment(rc.sink, f.handle, f.medianEnd);
  strokeSegment(rc.sink, f.upper, f.upperEnd);
  strokeSegment(rc.sink, f.lower, f.lowerEnd);
  rc.sink.restore();
}

double PitchforkTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                              const CoordinateTransform& xf) const {
  if (obj.points.size() < 3) return kNoHit;
  ScreenPoint s = xf.worldToScreen(p);
  Fork f = computeFork(xf, obj);

  double best = pointToSegmentDistance(s, f.handle, f.medianEnd);
  best = std::min(best, pointToSegmentDistance(s, f.upper, f.upperEnd));
  best = std::min(best, pointToSegmentDistance(s, f.lower, f.lowerEnd));
  return best;
}

} // namespace tc
