#pragma once
#include "tc/drawing/DrawingStore.hpp"
#include "tc/viewport/CoordinateTransform.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace tc {

struct HitResult {
  std::string objectId;        // empty = nothing hit
  int handleIndex{-1};         // >= 0 when a control point was hit
  double distance{std::numeric_limits<double>::infinity()};

  bool hit() const { return !objectId.empty(); }
  bool isHandle() const { return handleIndex >= 0; }
};

struct HitOptions {
  double thresholdPx{8.0};
  double handleRadiusPx{5.0};
  std::string selectedId;      // handles are only tested for this object
  PaneId pane{PaneId::Price};  // objects on other panes are ignored
};

// Pointer resolution: selected object's handles first, then bodies from
// the top of the stack down. The first body strictly inside the threshold
// wins.
class HitTester {
public:
  static HitResult hitTest(const WorldPoint& p, const CoordinateTransform& xf,
                           const ObjectList& objects, const HitOptions& opts);

  // Control point of `obj` within radius of `p`, or -1. Locked and hidden
  // objects have no live handles.
  static int hitHandle(const DrawingObject& obj, const WorldPoint& p,
                       const CoordinateTransform& xf, double radiusPx);

  // Indices into `objects`, topmost first: zIndex descending, and among
  // equal zIndex the later-inserted object first.
  static std::vector<std::size_t> topmostOrder(const ObjectList& objects);
};

} // namespace tc
