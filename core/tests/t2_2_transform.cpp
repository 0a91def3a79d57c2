// T2.2: CoordinateTransform world <-> screen mapping

#include "tc/viewport/CoordinateTransform.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static tc::BarSnapshot series(const std::vector<std::int64_t>& stamps) {
  auto bars = std::make_shared<tc::BarSeries>();
  for (std::int64_t t : stamps) {
    tc::Bar b;
    b.timestamp = t;
    b.open = b.high = b.low = b.close = 10.0;
    bars->push_back(b);
  }
  return bars;
}

static tc::ViewportState window(double start, double end, double pMin, double pMax,
                                int w, int h) {
  tc::ViewportState s;
  s.visibleStart = start;
  s.visibleEnd = end;
  s.priceMin = pMin;
  s.priceMax = pMax;
  s.widthPx = w;
  s.heightPx = h;
  return s;
}

int main() {
  // ten bars one second apart, starting at t=1000
  std::vector<std::int64_t> stamps;
  for (int i = 0; i < 10; i++) stamps.push_back(1000 + i * 1000);
  tc::CoordinateTransform xf(window(-0.5, 9.5, 0.0, 100.0, 1000, 500), series(stamps), 60000.0);

  // ---- Test 1: bars sit at integer indices ----
  {
    requireTrue(approx(xf.timeToIndex(1000), 0.0), "first bar index 0");
    requireTrue(approx(xf.timeToIndex(10000), 9.0), "last bar index 9");
    requireTrue(approx(xf.timeToIndex(1500), 0.5), "interpolated half step");
    requireTrue(approx(xf.indexToTime(3.0), 4000.0), "index 3 -> t 4000");
    requireTrue(approx(xf.timeToX(1000), 50.0), "first bar centred in its slot");
    requireTrue(approx(xf.timeToX(10000), 950.0), "last bar centred in its slot");
    requireTrue(approx(xf.pixelsPerBar(), 100.0), "100 px per bar");
    std::printf("  Test 1 (time axis): PASS\n");
  }

  // ---- Test 2: price axis is inverted (priceMax at the top) ----
  {
    requireTrue(approx(xf.priceToY(100.0), 0.0), "max at y=0");
    requireTrue(approx(xf.priceToY(0.0), 500.0), "min at bottom");
    requireTrue(approx(xf.priceToY(25.0), 375.0), "quarter price");
    requireTrue(approx(xf.yToPrice(375.0), 25.0), "inverse");
    std::printf("  Test 2 (price axis): PASS\n");
  }

  // ---- Test 3: world -> screen -> world round trip ----
  {
    const tc::WorldPoint pts[] = {
      {1000.0, 25.0}, {4500.0, 61.25}, {9999.0, 99.0}, {12500.0, -10.0}, {-3000.0, 150.0}
    };
    for (const auto& w : pts) {
      tc::ScreenPoint s = xf.worldToScreen(w);
      tc::WorldPoint back = xf.screenToWorld(s);
      requireTrue(approx(back.t, w.t, 1e-6), "time round trip");
      requireTrue(approx(back.p, w.p, 1e-9), "price round trip");
    }
    std::printf("  Test 3 (round trip): PASS\n");
  }

  // ---- Test 4: extrapolation past the ends uses the edge interval ----
  {
    requireTrue(approx(xf.timeToIndex(12000), 11.0), "two intervals past the end");
    requireTrue(approx(xf.timeToIndex(0), -1.0), "one interval before the start");
    requireTrue(approx(xf.indexToTime(-2.0), -1000.0), "index -2");
    requireTrue(approx(xf.indexToTime(10.5), 11500.0), "index 10.5");
    std::printf("  Test 4 (extrapolation): PASS\n");
  }

  // ---- Test 5: irregular spacing interpolates per gap ----
  {
    tc::CoordinateTransform gap(window(-0.5, 2.5, 0.0, 1.0, 300, 100),
                                series({0, 1000, 5000}), 60000.0);
    requireTrue(approx(gap.timeToIndex(3000), 1.5), "halfway through the wide gap");
    requireTrue(approx(gap.indexToTime(1.25), 2000.0), "quarter through the wide gap");
    requireTrue(approx(gap.timeToIndex(9000), 3.0), "extrapolates with last gap (4000)");
    std::printf("  Test 5 (irregular spacing): PASS\n");
  }

  // ---- Test 6: no bars falls back to the default interval ----
  {
    tc::CoordinateTransform empty(window(0.0, 10.0, 0.0, 1.0, 100, 100), nullptr, 60000.0);
    requireTrue(empty.bars().empty(), "null snapshot becomes empty series");
    requireTrue(approx(empty.timeToIndex(120000.0), 2.0), "t / default interval");
    requireTrue(approx(empty.indexToTime(3.0), 180000.0), "index * default interval");

    tc::CoordinateTransform single(window(-0.5, 0.5, 0.0, 1.0, 100, 100),
                                   series({5000}), 1000.0);
    requireTrue(approx(single.timeToIndex(7000), 2.0), "single bar uses default interval");
    std::printf("  Test 6 (no bars): PASS\n");
  }

  // ---- Test 7: degenerate price range maps to mid-height ----
  {
    tc::CoordinateTransform flat(window(-0.5, 9.5, 5.0, 5.0, 1000, 400), series(stamps), 60000.0);
    requireTrue(approx(flat.priceToY(123.0), 200.0), "flat range -> middle");
    std::printf("  Test 7 (flat price range): PASS\n");
  }

  std::printf("T2.2 transform: ALL PASS\n");
  return 0;
}
