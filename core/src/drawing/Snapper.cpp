#include "tc/drawing/Snapper.hpp"
#include "tc/math/NiceTicks.hpp"

#include <cmath>

namespace tc {

SnapResult Snapper::snap(const WorldPoint& raw, const CoordinateTransform& xf,
                         const SnapConfig& cfg, const ObjectList& objects,
                         const std::string& excludeId, PaneId pane) {
  SnapResult r;
  r.point = raw;
  if (!cfg.enabled) return r;

  if (cfg.snapToTime) r.time = snapTime(r.point, xf, cfg.thresholdPx);
  if (cfg.snapToPrice) r.price = snapPrice(r.point, xf, cfg.thresholdPx);
  if (cfg.snapToObjects)
    r.object = snapObject(r.point, xf, cfg.thresholdPx, objects, excludeId, &r.objectId, pane);
  return r;
}

bool Snapper::snapTime(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx) {
  const BarSeries& bars = xf.bars();
  if (bars.empty()) return false;

  // Bars sit at integer indices; only the neighbours of the rounded index
  // can be the nearest on screen.
  double x = xf.timeToX(p.t);
  double idx = xf.timeToIndex(p.t);
  if (!std::isfinite(idx)) return false;
  long n = static_cast<long>(bars.size());
  long center = 0;
  if (idx >= static_cast<double>(n - 1))
    center = n - 1;
  else if (idx > 0.0)
    center = static_cast<long>(std::lround(idx));

  long best = -1;
  double bestDist = 0;
  for (long i = center - 1; i <= center + 1; ++i) {
    if (i < 0 || i >= n) continue;
    double d = std::fabs(xf.indexToX(static_cast<double>(i)) - x);
    if (best < 0 || d < bestDist) {
      best = i;
      bestDist = d;
    }
  }
  if (best < 0 || bestDist > thresholdPx) return false;

  p.t = static_cast<double>(bars[static_cast<std::size_t>(best)].timestamp);
  return true;
}

bool Snapper::snapPrice(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx) {
  const ViewportState& st = xf.state();
  double step = magnitudeStep(st.priceMax - st.priceMin);
  if (step <= 0.0) return false;

  double rounded = std::round(p.p / step) * step;
  if (std::fabs(xf.priceToY(rounded) - xf.priceToY(p.p)) > thresholdPx) return false;
  p.p = rounded;
  return true;
}

bool Snapper::snapObject(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx,
                         const ObjectList& objects, const std::string& excludeId,
                         std::string* hitId, PaneId pane) {
  ScreenPoint s = xf.worldToScreen(p);
  const WorldPoint* best = nullptr;
  const DrawingObject* bestObj = nullptr;
  double bestDist = thresholdPx;

  for (const auto& h : objects) {
    if (!h->visible || h->id == excludeId || !onPane(*h, pane)) continue;
    for (const auto& wp : h->points) {
      double d = distance(s, xf.worldToScreen(wp));
      if (d <= bestDist) {
        bestDist = d;
        best = &wp;
        bestObj = h.get();
      }
    }
  }
  if (!best) return false;

  p = *best;
  if (hitId) *hitId = bestObj->id;
  return true;
}

} // namespace tc
