#include "tc/drawing/HitTester.hpp"
#include "tc/drawing/ToolRegistry.hpp"

#include <algorithm>

namespace tc {

std::vector<std::size_t> HitTester::topmostOrder(const ObjectList& objects) {
  std::vector<std::size_t> order;
  order.reserve(objects.size());
  for (std::size_t i = objects.size(); i > 0; --i) order.push_back(i - 1);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return objects[a]->zIndex > objects[b]->zIndex;
  });
  return order;
}

int HitTester::hitHandle(const DrawingObject& obj, const WorldPoint& p,
                         const CoordinateTransform& xf, double radiusPx) {
  if (obj.locked || !obj.visible) return -1;
  ScreenPoint s = xf.worldToScreen(p);
  int best = -1;
  double bestDist = radiusPx;
  for (std::size_t i = 0; i < obj.points.size(); ++i) {
    double d = distance(s, xf.worldToScreen(obj.points[i]));
    if (d <= bestDist) {
      bestDist = d;
      best = static_cast<int>(i);
    }
  }
  return best;
}

HitResult HitTester::hitTest(const WorldPoint& p, const CoordinateTransform& xf,
                             const ObjectList& objects, const HitOptions& opts) {
  HitResult r;

  if (!opts.selectedId.empty()) {
    for (const auto& h : objects) {
      if (h->id != opts.selectedId) continue;
      if (!onPane(*h, opts.pane)) break;
      int handle = hitHandle(*h, p, xf, opts.handleRadiusPx);
      if (handle >= 0) {
        r.objectId = h->id;
        r.handleIndex = handle;
        r.distance = distance(xf.worldToScreen(p),
                              xf.worldToScreen(h->points[static_cast<std::size_t>(handle)]));
        return r;
      }
      break;
    }
  }

  for (std::size_t i : topmostOrder(objects)) {
    const DrawingObject& obj = *objects[i];
    if (!obj.visible || obj.locked || !onPane(obj, opts.pane)) continue;
    double d = toolFor(obj.type).hitTest(obj, p, xf);
    if (d < opts.thresholdPx) {
      r.objectId = obj.id;
      r.distance = d;
      return r;
    }
  }
  return r;
}

} // namespace tc
