#pragma once
#include "tc/drawing/DrawingStore.hpp"
#include "tc/viewport/CoordinateTransform.hpp"

#include <string>

namespace tc {

struct SnapConfig {
  bool enabled{true};
  bool snapToTime{true};
  bool snapToPrice{true};
  bool snapToObjects{true};
  double thresholdPx{12.0};
};

struct SnapResult {
  WorldPoint point;
  bool time{false};
  bool price{false};
  bool object{false};
  std::string objectId;    // source of an object snap

  bool snapped() const { return time || price || object; }
};

// Magnetic snapping for points placed while drafting. Passes run in the
// order time, price, object; each sees the previous pass's result and
// applies only within thresholdPx on screen. Object snaps only consider
// objects shown on `pane`.
class Snapper {
public:
  static SnapResult snap(const WorldPoint& raw, const CoordinateTransform& xf,
                         const SnapConfig& cfg, const ObjectList& objects,
                         const std::string& excludeId = std::string(),
                         PaneId pane = PaneId::Price);

  // Individual passes. Each returns true and rewrites `p` when it snapped.
  static bool snapTime(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx);
  static bool snapPrice(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx);
  static bool snapObject(WorldPoint& p, const CoordinateTransform& xf, double thresholdPx,
                         const ObjectList& objects, const std::string& excludeId,
                         std::string* hitId = nullptr, PaneId pane = PaneId::Price);
};

} // namespace tc
