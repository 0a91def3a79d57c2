// T4.1: Drafting protocol, hit testing and rendering of the line and shape tools

#include "tc/drawing/ToolRegistry.hpp"
#include "tc/drawing/tools/LineTools.hpp"
#include "tc/drawing/tools/ShapeTools.hpp"
#include "tc/render/RecordingSink.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool approx(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) < eps;
}

// x = t / 10, y = 500 - 5p on a 1000x500 canvas.
static tc::CoordinateTransform linearTransform() {
  tc::ViewportState s;
  s.visibleStart = 0.0;
  s.visibleEnd = 10.0;
  s.priceMin = 0.0;
  s.priceMax = 100.0;
  s.widthPx = 1000;
  s.heightPx = 500;
  return tc::CoordinateTransform(s, nullptr, 1000.0);
}

static tc::DrawingObject twoPoint(tc::DrawingType type, tc::WorldPoint a, tc::WorldPoint b) {
  const tc::DrawingTool& tool = tc::toolFor(type);
  tc::DrawingObject obj = tool.onStart(a, tc::DrawingStyle{});
  tool.onUpdate(obj, b);
  tool.onComplete(obj);
  return obj;
}

int main() {
  tc::CoordinateTransform xf = linearTransform();

  // ---- Test 1: drafting protocol ----
  {
    const tc::DrawingTool& tl = tc::toolFor(tc::DrawingType::Trendline);
    tc::DrawingObject d = tl.onStart({1000, 10}, tc::DrawingStyle{});
    requireTrue(d.type == tc::DrawingType::Trendline, "type set");
    requireTrue(d.points.size() == 1, "start holds one point");
    requireTrue(d.metaText("lineText") == "" && d.meta.count("showText") == 1, "caption meta");

    tl.onUpdate(d, {2000, 20});
    requireTrue(d.points.size() == 2, "update appends second point");
    tl.onUpdate(d, {3000, 30});
    requireTrue(d.points.size() == 2, "further updates move the trailing point");
    requireTrue(d.points[1].t == 3000 && d.points[1].p == 30, "trailing point moved");
    requireTrue(d.points[0].t == 1000 && d.points[0].p == 10, "anchor kept");

    const tc::DrawingTool& hl = tc::toolFor(tc::DrawingType::HorizontalLine);
    tc::DrawingObject h = hl.onStart({1000, 10}, tc::DrawingStyle{});
    hl.onUpdate(h, {2000, 40});
    requireTrue(h.points.size() == 1 && h.points[0].p == 40, "single point tools replace");

    tc::DrawingObject v = tc::toolFor(tc::DrawingType::VerticalLine).onStart({4000, 1}, tc::DrawingStyle{});
    requireTrue(v.paneId == tc::PaneId::Full, "vline spans every pane");
    std::printf("  Test 1 (drafting protocol): PASS\n");
  }

  // ---- Test 2: trendline, ray and arrow hit testing ----
  {
    tc::DrawingObject tl = twoPoint(tc::DrawingType::Trendline, {1000, 10}, {5000, 50});
    const tc::DrawingTool& tool = tc::toolFor(tl.type);
    requireTrue(tool.hitTest(tl, {3000, 30}, xf) < 1e-9, "point on segment is distance 0");
    requireTrue(tool.hitTest(tl, {3000, 40}, xf) > 8.0, "off the line");
    requireTrue(approx(tool.hitTest(tl, {7000, 70}, xf), std::hypot(200.0, 100.0)),
                "segment clamps at its end");

    tc::DrawingObject ray = twoPoint(tc::DrawingType::Ray, {1000, 10}, {5000, 50});
    requireTrue(tc::toolFor(ray.type).hitTest(ray, {7000, 70}, xf) < 1e-9, "ray continues past p1");
    requireTrue(tc::toolFor(ray.type).hitTest(ray, {0, 0}, xf) > 8.0, "ray does not go backwards");

    tc::DrawingObject arrow = twoPoint(tc::DrawingType::Arrow, {1000, 10}, {5000, 50});
    requireTrue(tc::toolFor(arrow.type).hitTest(arrow, {3000, 30}, xf) < 1e-9, "arrow shaft");

    tc::DrawingObject lone;
    lone.type = tc::DrawingType::Trendline;
    lone.points.push_back({1000, 10});
    requireTrue(tool.hitTest(lone, {1000, 10}, xf) == tc::kNoHit, "incomplete object never hits");
    std::printf("  Test 2 (line hit testing): PASS\n");
  }

  // ---- Test 3: horizontal and vertical lines ----
  {
    tc::DrawingObject h = tc::toolFor(tc::DrawingType::HorizontalLine).onStart({2000, 40}, tc::DrawingStyle{});
    const tc::DrawingTool& hl = tc::toolFor(h.type);
    requireTrue(approx(hl.hitTest(h, {9999, 42}, xf), 10.0), "vertical pixel distance");
    requireTrue(hl.hitTest(h, {-50000, 40}, xf) < 1e-9, "spans all time");

    tc::DrawingObject v = tc::toolFor(tc::DrawingType::VerticalLine).onStart({4000, 1}, tc::DrawingStyle{});
    const tc::DrawingTool& vl = tc::toolFor(v.type);
    requireTrue(approx(vl.hitTest(v, {4500, 90}, xf), 50.0), "horizontal pixel distance");
    requireTrue(vl.hitTest(v, {4000, -1000}, xf) < 1e-9, "spans all prices");
    std::printf("  Test 3 (horizontal/vertical): PASS\n");
  }

  // ---- Test 4: rectangle and ellipse ----
  {
    tc::DrawingObject r = twoPoint(tc::DrawingType::Rectangle, {1000, 10}, {3000, 30});
    requireTrue(r.style.fillColor == r.style.color, "fill defaults to line colour");
    requireTrue(approx(r.style.opacity, 0.1), "translucent fill");
    const tc::DrawingTool& rt = tc::toolFor(r.type);
    requireTrue(rt.hitTest(r, {2000, 20}, xf) == 0.0, "inside the zone");
    requireTrue(approx(rt.hitTest(r, {4000, 20}, xf), 100.0), "right of the zone");

    tc::DrawingObject e = twoPoint(tc::DrawingType::Ellipse, {1000, 10}, {3000, 30});
    const tc::DrawingTool& et = tc::toolFor(e.type);
    requireTrue(et.hitTest(e, {2000, 20}, xf) == 0.0, "centre");
    requireTrue(approx(et.hitTest(e, {2000, 35}, xf), 25.0), "outside along the minor axis");

    tc::DrawingObject flat = twoPoint(tc::DrawingType::Ellipse, {1000, 10}, {3000, 10});
    requireTrue(et.hitTest(flat, {2000, 10}, xf) < 1e-9, "collapsed ellipse acts as a segment");
    std::printf("  Test 4 (shapes): PASS\n");
  }

  // ---- Test 5: rendering ----
  {
    tc::RecordingSink sink;
    tc::RenderContext rc{sink, xf};

    tc::DrawingObject tl = twoPoint(tc::DrawingType::Trendline, {1000, 10}, {5000, 50});
    tc::toolFor(tl.type).render(tl, rc);
    requireTrue(sink.count(tc::RenderOp::Save) == sink.count(tc::RenderOp::Restore), "balanced save");
    requireTrue(sink.count(tc::RenderOp::Stroke) == 1, "one stroke");
    const auto& cmds = sink.commands();
    auto lineTo = std::find_if(cmds.begin(), cmds.end(),
      [](const tc::RenderCommand& c) { return c.op == tc::RenderOp::LineTo; });
    requireTrue(lineTo != cmds.end(), "has lineTo");
    requireTrue(approx(lineTo->args[0], 500.0) && approx(lineTo->args[1], 250.0), "ends at p1");

    sink.clear();
    tl.meta["showText"] = tc::MetaValue::ofFlag(true);
    tl.meta["lineText"] = tc::MetaValue::ofText("breakout");
    tc::toolFor(tl.type).render(tl, rc);
    requireTrue(sink.texts().size() == 1 && sink.texts()[0] == "breakout", "line caption");

    sink.clear();
    tc::DrawingObject h = tc::toolFor(tc::DrawingType::HorizontalLine).onStart({2000, 40}, tc::DrawingStyle{});
    tc::toolFor(h.type).render(h, rc);
    requireTrue(sink.texts().size() == 1 && sink.texts()[0] == "40.00", "price label");

    sink.clear();
    tc::DrawingObject arrow = twoPoint(tc::DrawingType::Arrow, {1000, 10}, {5000, 50});
    tc::toolFor(arrow.type).render(arrow, rc);
    requireTrue(sink.count(tc::RenderOp::Fill) == 1, "arrow head is filled");

    sink.clear();
    tc::DrawingObject r = twoPoint(tc::DrawingType::Rectangle, {1000, 10}, {3000, 30});
    tc::toolFor(r.type).render(r, rc);
    requireTrue(sink.count(tc::RenderOp::Fill) == 1 && sink.count(tc::RenderOp::Stroke) == 1,
                "fill then outline");

    sink.clear();
    tc::DrawingObject ray = twoPoint(tc::DrawingType::Ray, {1000, 10}, {5000, 50});
    tc::toolFor(ray.type).render(ray, rc);
    const auto& rayCmds = sink.commands();
    auto rayEnd = std::find_if(rayCmds.begin(), rayCmds.end(),
      [](const tc::RenderCommand& c) { return c.op == tc::RenderOp::LineTo; });
    requireTrue(rayEnd != rayCmds.end() && approx(rayEnd->args[0], 1000.0), "ray reaches the edge");
    std::printf("  Test 5 (rendering): PASS\n");
  }

  std::printf("T4.1 tools_lines: ALL PASS\n");
  return 0;
}
