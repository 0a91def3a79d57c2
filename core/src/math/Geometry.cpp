#include "tc/math/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tc {

double distance(const ScreenPoint& a, const ScreenPoint& b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

static double projectionParam(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b,
                              bool& degenerate) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  double lenSq = dx * dx + dy * dy;
  degenerate = lenSq <= 0.0;
  if (degenerate) return 0.0;
  return ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
}

double pointToSegmentDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b) {
  bool degenerate = false;
  double t = projectionParam(p, a, b, degenerate);
  if (degenerate) return distance(p, a);
  t = std::max(0.0, std::min(1.0, t));
  ScreenPoint proj{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
  return distance(p, proj);
}

double pointToRayDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b) {
  bool degenerate = false;
  double t = projectionParam(p, a, b, degenerate);
  if (degenerate) return distance(p, a);
  t = std::max(0.0, t);
  ScreenPoint proj{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
  return distance(p, proj);
}

double pointToLineDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b) {
  bool degenerate = false;
  double t = projectionParam(p, a, b, degenerate);
  if (degenerate) return distance(p, a);
  ScreenPoint proj{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
  return distance(p, proj);
}

double pointToRectDistance(const ScreenPoint& p, const ScreenPoint& c0, const ScreenPoint& c1) {
  double left = std::min(c0.x, c1.x), right = std::max(c0.x, c1.x);
  double top = std::min(c0.y, c1.y), bottom = std::max(c0.y, c1.y);

  if (p.x >= left && p.x <= right && p.y >= top && p.y <= bottom) return 0.0;

  double dx = std::max({left - p.x, 0.0, p.x - right});
  double dy = std::max({top - p.y, 0.0, p.y - bottom});
  return std::hypot(dx, dy);
}

ScreenPoint extendRayToBounds(const ScreenPoint& a, const ScreenPoint& b, double w, double h) {
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  if (dx == 0.0 && dy == 0.0) return b;

  // Largest t such that a + t*d stays inside the box (t >= 1).
  double tMax = std::numeric_limits<double>::max();
  if (dx > 0) tMax = std::min(tMax, (w - a.x) / dx);
  else if (dx < 0) tMax = std::min(tMax, (0.0 - a.x) / dx);
  if (dy > 0) tMax = std::min(tMax, (h - a.y) / dy);
  else if (dy < 0) tMax = std::min(tMax, (0.0 - a.y) / dy);
  tMax = std::max(tMax, 1.0);

  return ScreenPoint{a.x + dx * tMax, a.y + dy * tMax};
}

} // namespace tc
