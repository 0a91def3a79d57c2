// T2.1: ViewportManager window invariants, zoom anchoring, timeframes,
// auto-scale, listeners and keyboard navigation

#include "tc/viewport/KeyboardNav.hpp"
#include "tc/viewport/ViewportManager.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

static const std::int64_t kDay = 86400000;
static const std::int64_t kStart = 1704067200000;   // 2024-01-01 UTC

static tc::BarStore makeBars(int n, std::int64_t interval = kDay) {
  std::vector<tc::Bar> bars;
  for (int i = 0; i < n; i++) {
    tc::Bar b;
    b.timestamp = kStart + i * interval;
    b.open = 100.0 + i * 0.5;
    b.close = b.open + ((i % 2) ? -1.0 : 1.0);
    b.high = std::max(b.open, b.close) + 1.0;
    b.low = std::min(b.open, b.close) - 1.0;
    b.volume = 1000.0 + i * 10.0;
    bars.push_back(b);
  }
  tc::BarStore store;
  store.replace(bars);
  return store;
}

static void checkInvariants(const tc::ViewportManager& vp, std::size_t n, const char* where) {
  const tc::ViewportState& s = vp.state();
  double span = s.visibleEnd - s.visibleStart;
  double lo = std::min(vp.config().minBars, static_cast<double>(n));
  double hi = std::min(vp.config().maxBars, static_cast<double>(n));
  if (!(s.visibleEnd > s.visibleStart)) {
    std::fprintf(stderr, "after %s: ", where);
    requireTrue(false, "visibleEnd > visibleStart");
  }
  if (span < lo - 1e-9 || span > hi + 1e-9) {
    std::fprintf(stderr, "after %s: span %.6f\n", where, span);
    requireTrue(false, "span within [minBars, maxBars]");
  }
  if (s.visibleStart < -0.5 - 1e-9 || s.visibleEnd > static_cast<double>(n) - 0.5 + 1e-9) {
    std::fprintf(stderr, "after %s: [%.6f, %.6f]\n", where, s.visibleStart, s.visibleEnd);
    requireTrue(false, "window inside [-0.5, n-0.5]");
  }
}

int main() {
  // ---- Test 1: first data shows the default timeframe (1Y = 252 bars) ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));
    const auto& s = vp.state();
    requireTrue(approx(s.visibleEnd, 299.5), "anchored on latest bar");
    requireTrue(approx(s.visibleBars, 252.0), "252 bars visible");
    requireTrue(approx(s.barWidthPx, 800.0 / 252.0), "bar width derived");
    requireTrue(s.timeframe == tc::Timeframe::OneYear, "timeframe 1Y");
    requireTrue(s.timeAxisLevel == tc::TimeAxisLevel::Month, "252 days -> month axis");
    checkInvariants(vp, 300, "initial");
    std::printf("  Test 1 (initial window): PASS\n");
  }

  // ---- Test 2: invariants hold across pan/zoom/wheel/range sequences ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(1000, 500);
    vp.setData(makeBars(500));
    const double pans[] = {-37.0, 120.5, -1e6, 1e6, 3.25, -0.75};
    const double zooms[] = {1.7, 0.3, 25.0, 0.01, 1.0001, 4.0};
    for (int round = 0; round < 6; round++) {
      vp.panBy(pans[round]);
      checkInvariants(vp, 500, "panBy");
      vp.zoomAt(zooms[round], 100.0 + round * 150.0);
      checkInvariants(vp, 500, "zoomAt");
      vp.wheelZoom(round * 170.0, (round % 2 ? 1.0 : -1.0) * 300.0);
      checkInvariants(vp, 500, "wheelZoom");
      vp.panByPixels(round * 40.0 - 100.0);
      checkInvariants(vp, 500, "panByPixels");
    }
    vp.setVisibleRange(480.0, 10.0);
    checkInvariants(vp, 500, "reversed setVisibleRange");
    vp.setVisibleRange(-100.0, 2000.0);
    checkInvariants(vp, 500, "oversized setVisibleRange");
    vp.setVisibleRange(200.0, 201.0);
    checkInvariants(vp, 500, "undersized setVisibleRange");
    requireTrue(approx(vp.state().visibleEnd - vp.state().visibleStart, 20.0), "clamped to minBars");
    std::printf("  Test 2 (window invariants): PASS\n");
  }

  // ---- Test 3: wheelZoom keeps the bar under the cursor in place ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));
    vp.setVisibleRange(100.0, 200.0);

    const double anchors[] = {300.0, 12.0, 790.0};
    const double deltas[] = {-240.0, 180.0, -500.0};
    for (int i = 0; i < 3; i++) {
      vp.setVisibleRange(100.0, 200.0);
      double t = vp.xToTime(anchors[i]);
      vp.wheelZoom(anchors[i], deltas[i]);
      double x = vp.timeToX(t);
      requireTrue(std::fabs(x - anchors[i]) <= 1.0, "anchor within 1px after wheel zoom");
      checkInvariants(vp, 300, "anchored zoom");
    }
    std::printf("  Test 3 (wheel zoom anchor): PASS\n");
  }

  // ---- Test 4: span clamps and edge clamps ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));

    vp.zoomAt(1000.0, 400.0);
    requireTrue(approx(vp.state().visibleBars, 20.0), "zoom in clamps to minBars");
    vp.zoomAt(0.0001, 400.0);
    requireTrue(approx(vp.state().visibleBars, 300.0), "zoom out clamps to bar count");
    requireTrue(approx(vp.state().visibleStart, -0.5), "full range starts at -0.5");

    vp.setVisibleRange(100.0, 150.0);
    vp.panBy(-1e9);
    requireTrue(approx(vp.state().visibleStart, -0.5), "pan clamps at left edge");
    requireTrue(approx(vp.state().visibleBars, 50.0), "pan keeps span");
    vp.panBy(1e9);
    requireTrue(approx(vp.state().visibleEnd, 299.5), "pan clamps at right edge");

    vp.panBy(std::nan(""));
    requireTrue(approx(vp.state().visibleEnd, 299.5), "NaN pan ignored");
    vp.wheelZoom(std::nan(""), 100.0);
    requireTrue(approx(vp.state().visibleBars, 50.0), "NaN wheel ignored");
    std::printf("  Test 4 (clamping): PASS\n");
  }

  // ---- Test 5: timeframes ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));

    requireTrue(vp.applyTimeframe("1M"), "1M accepted");
    requireTrue(approx(vp.state().visibleBars, 22.0), "1M = 22 bars");
    requireTrue(approx(vp.state().visibleEnd, 299.5), "anchored on latest");
    requireTrue(vp.state().timeAxisLevel == tc::TimeAxisLevel::Day, "22 days -> day axis");

    requireTrue(vp.applyTimeframe("5D"), "5D accepted");
    requireTrue(approx(vp.state().visibleBars, 20.0), "5D clamps up to minBars");

    requireTrue(vp.applyTimeframe("ALL"), "ALL accepted");
    requireTrue(approx(vp.state().visibleBars, 300.0), "ALL shows every bar");

    // 2024-01-01 + 299 days is in 2024, so YTD covers the whole series
    requireTrue(vp.applyTimeframe("YTD"), "YTD accepted");
    requireTrue(approx(vp.state().visibleBars, 300.0), "YTD from Jan 1");

    tc::ViewportState before = vp.state();
    requireTrue(!vp.applyTimeframe("2W"), "unknown period rejected");
    requireTrue(!vp.applyTimeframe("Custom"), "Custom is not requestable");
    requireTrue(approx(vp.state().visibleStart, before.visibleStart), "rejection leaves window");

    vp.panBy(-5.0);
    requireTrue(vp.state().timeframe == tc::Timeframe::Custom, "manual pan -> Custom");
    std::printf("  Test 5 (timeframes): PASS\n");
  }

  // ---- Test 6: price auto-scale, manual scale, volume max ----
  {
    tc::BarStore store = makeBars(300);
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(store);
    vp.setVisibleRange(50.0, 99.0);

    std::size_t first = 0, last = 0;
    requireTrue(vp.visibleBarRange(first, last), "visible bars exist");
    requireTrue(first == 50 && last == 99, "visible index range");

    double lo = 1e300, hi = -1e300, vmax = 0.0;
    for (std::size_t i = first; i <= last; i++) {
      lo = std::min(lo, store.at(i).low);
      hi = std::max(hi, store.at(i).high);
      vmax = std::max(vmax, store.at(i).volume);
    }
    const auto& s = vp.state();
    double pad = (hi - lo) * 0.08;
    requireTrue(approx(s.priceMin, lo - pad), "priceMin padded 8%");
    requireTrue(approx(s.priceMax, hi + pad), "priceMax padded 8%");
    requireTrue(approx(s.volumeMax, vmax * 1.1), "volumeMax with headroom");

    vp.setPriceRange(200.0, 50.0);
    requireTrue(!vp.state().autoScalePrice, "manual scale disables auto");
    requireTrue(approx(vp.state().priceMin, 50.0) && approx(vp.state().priceMax, 200.0),
                "manual range ordered");
    vp.panBy(10.0);
    requireTrue(approx(vp.state().priceMin, 50.0), "manual range survives pan");
    vp.fitPriceToVisible();
    requireTrue(vp.state().autoScalePrice, "fit re-enables auto");
    requireTrue(vp.state().priceMin > 50.0, "range refitted");
    std::printf("  Test 6 (price scale): PASS\n");
  }

  // ---- Test 7: range and edge listeners ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));
    vp.setVisibleRange(100.0, 150.0);

    int rangeCalls = 0;
    int leftEdge = 0, rightEdge = 0;
    vp.setRangeListener([&](double, double) { rangeCalls++; });
    vp.setEdgeListener([&](tc::DataEdge e) {
      if (e == tc::DataEdge::Left) leftEdge++;
      else rightEdge++;
    });

    vp.panBy(-5.0);
    requireTrue(rangeCalls == 1, "range listener fires on pan");
    requireTrue(leftEdge == 0 && rightEdge == 0, "no edge far from ends");

    vp.panBy(-1000.0);
    requireTrue(leftEdge == 1, "left edge entered");
    vp.panBy(1.0);
    requireTrue(leftEdge == 1, "no repeat inside the zone");
    vp.panBy(1000.0);
    requireTrue(rightEdge == 1, "right edge entered");
    std::printf("  Test 7 (listeners): PASS\n");
  }

  // ---- Test 8: keyboard navigation ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(300));
    vp.setVisibleRange(100.0, 200.0);

    tc::KeyboardNav nav;
    requireTrue(nav.processKey(tc::KeyCode::Left, vp), "left consumed");
    requireTrue(approx(vp.state().visibleStart, 90.0), "left pans 10% earlier");
    requireTrue(nav.processKey(tc::KeyCode::Right, vp), "right consumed");
    requireTrue(approx(vp.state().visibleStart, 100.0), "right pans back");

    requireTrue(nav.processKey(tc::KeyCode::Up, vp), "up consumed");
    requireTrue(vp.state().visibleBars < 100.0, "up zooms in");
    requireTrue(nav.processKey(tc::KeyCode::Down, vp), "down consumed");
    requireTrue(approx(vp.state().visibleBars, 100.0, 1e-6), "down undoes up");

    requireTrue(nav.processKey(tc::KeyCode::End, vp), "end consumed");
    requireTrue(approx(vp.state().visibleEnd, 299.5), "end scrolls to latest");
    requireTrue(nav.processKey(tc::KeyCode::Home, vp), "home consumed");
    requireTrue(approx(vp.state().visibleBars, 300.0), "home shows all");
    requireTrue(!nav.processKey(tc::KeyCode::Escape, vp), "escape not a nav key");

    tc::KeyboardNavConfig cfg;
    cfg.panFraction = 0.5;
    nav.setConfig(cfg);
    vp.setVisibleRange(100.0, 200.0);
    nav.processKey(tc::KeyCode::Right, vp);
    requireTrue(approx(vp.state().visibleStart, 150.0), "configured pan fraction");
    std::printf("  Test 8 (keyboard nav): PASS\n");
  }

  // ---- Test 9: degenerate data ----
  {
    tc::ViewportManager vp;
    checkInvariants(vp, 1, "empty");
    vp.panBy(3.0);
    vp.zoomAt(2.0, 10.0);
    checkInvariants(vp, 1, "empty after input");
    requireTrue(approx(vp.state().priceMin, 0.0) && approx(vp.state().priceMax, 1.0),
                "empty price range 0..1");

    vp.setData(makeBars(5));
    requireTrue(approx(vp.state().visibleBars, 5.0), "short series fully visible");
    checkInvariants(vp, 5, "five bars");

    std::vector<tc::Bar> flat(3);
    for (int i = 0; i < 3; i++) {
      flat[static_cast<std::size_t>(i)].timestamp = kStart + i * kDay;
      flat[static_cast<std::size_t>(i)].open = flat[static_cast<std::size_t>(i)].high =
        flat[static_cast<std::size_t>(i)].low = flat[static_cast<std::size_t>(i)].close = 50.0;
    }
    tc::BarStore flatStore;
    flatStore.replace(flat);
    vp.setData(flatStore);
    requireTrue(vp.state().priceMax > vp.state().priceMin, "flat series still has a range");
    std::printf("  Test 9 (degenerate data): PASS\n");
  }

  // ---- Test 10: intraday bars pick the minute axis ----
  {
    tc::ViewportManager vp;
    vp.setCanvasSize(800, 600);
    vp.setData(makeBars(100, 5 * 60 * 1000));
    vp.showAll();
    requireTrue(vp.state().timeAxisLevel == tc::TimeAxisLevel::Minute, "8h span -> minute axis");
    std::printf("  Test 10 (time axis level): PASS\n");
  }

  std::printf("T2.1 viewport: ALL PASS\n");
  return 0;
}
