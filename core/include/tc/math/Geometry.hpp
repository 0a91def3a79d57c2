#pragma once

namespace tc {

// World coordinate: epoch-ms timestamp x price. The only coordinate a
// drawing object ever stores.
struct WorldPoint {
  double t{0};
  double p{0};
};

// Pixel coordinate, 0 = left/top. Transient; never persisted.
struct ScreenPoint {
  double x{0};
  double y{0};
};

inline bool operator==(const WorldPoint& a, const WorldPoint& b) { return a.t == b.t && a.p == b.p; }
inline bool operator!=(const WorldPoint& a, const WorldPoint& b) { return !(a == b); }

double distance(const ScreenPoint& a, const ScreenPoint& b);

// Distance from p to the closed segment [a, b] (clamped projection).
// A degenerate segment degrades to point distance.
double pointToSegmentDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b);

// Distance from p to the half-line starting at a through b.
double pointToRayDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b);

// Distance from p to the infinite line through a and b.
double pointToLineDistance(const ScreenPoint& p, const ScreenPoint& a, const ScreenPoint& b);

// Axis-aligned rectangle spanned by two corners: 0 inside, else distance to
// the nearest edge.
double pointToRectDistance(const ScreenPoint& p, const ScreenPoint& c0, const ScreenPoint& c1);

// Extend the ray a->b until it leaves [0,w]x[0,h]. Returns b when a == b.
ScreenPoint extendRayToBounds(const ScreenPoint& a, const ScreenPoint& b, double w, double h);

} // namespace tc
