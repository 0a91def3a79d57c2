#include "tc/render/RenderContext.hpp"
#include "tc/render/Color.hpp"

namespace tc {

static const float kFallbackColor[4] = {0.055f, 0.647f, 0.914f, 1.0f}; // #0EA5E9

void applyStrokeStyle(RenderContext& rc, const DrawingStyle& style) {
  float rgba[4];
  parseColorOr(style.color, kFallbackColor, rgba);
  rc.sink.setStrokeColor(rgba);

  double width = style.lineWidth;
  if (rc.hovered || rc.selected) width += 1.0;
  rc.sink.setLineWidth(width);

  switch (style.lineStyle) {
    case LineStyle::Solid:  rc.sink.setLineDash({}); break;
    case LineStyle::Dashed: rc.sink.setLineDash({5.0, 5.0}); break;
    case LineStyle::Dotted: rc.sink.setLineDash({2.0, 2.0}); break;
  }

  rc.sink.setGlobalAlpha(style.opacity * rc.alpha);
}

void applyFill(RenderContext& rc, const std::string& color, double opacity) {
  float rgba[4];
  parseColorOr(color, kFallbackColor, rgba);
  rc.sink.setFillColor(rgba);
  rc.sink.setGlobalAlpha(opacity * rc.alpha);
}

void strokeSegment(RenderSink& sink, const ScreenPoint& a, const ScreenPoint& b) {
  sink.beginPath();
  sink.moveTo(a.x, a.y);
  sink.lineTo(b.x, b.y);
  sink.stroke();
}

void strokePolyline(RenderSink& sink, const ScreenPoint* pts, int count) {
  if (count < 2) return;
  sink.beginPath();
  sink.moveTo(pts[0].x, pts[0].y);
  for (int i = 1; i < count; ++i) sink.lineTo(pts[i].x, pts[i].y);
  sink.stroke();
}

void drawLabel(RenderContext& rc, const DrawingStyle& style, const std::string& text,
               double x, double y, TextAlign align) {
  rc.sink.setFont(11.0, style.fontFamily, "normal");
  rc.sink.setTextAlign(align);
  rc.sink.fillText(text, x, y);
}

} // namespace tc
