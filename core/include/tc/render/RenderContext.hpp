#pragma once
#include "tc/drawing/DrawingTypes.hpp"
#include "tc/render/RenderSink.hpp"
#include "tc/viewport/CoordinateTransform.hpp"

#include <string>

namespace tc {

// Everything a tool needs to draw one object.
struct RenderContext {
  RenderSink& sink;
  const CoordinateTransform& xf;
  double alpha{1.0};       // multiplied into style opacity (drafts use < 1)
  bool selected{false};
  bool hovered{false};
};

// Stroke colour, width, dash pattern and alpha from a style.
void applyStrokeStyle(RenderContext& rc, const DrawingStyle& style);

// Fill colour at the given opacity (multiplied by rc.alpha).
void applyFill(RenderContext& rc, const std::string& color, double opacity);

void strokeSegment(RenderSink& sink, const ScreenPoint& a, const ScreenPoint& b);
void strokePolyline(RenderSink& sink, const ScreenPoint* pts, int count);

// Small label with the current fill colour.
void drawLabel(RenderContext& rc, const DrawingStyle& style, const std::string& text,
               double x, double y, TextAlign align);

} // namespace tc
