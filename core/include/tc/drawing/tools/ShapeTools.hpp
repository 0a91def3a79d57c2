#pragma once
#include "tc/drawing/DrawingTool.hpp"

namespace tc {

// Filled zone spanned by two opposite corners. style.opacity applies to
// the fill; the outline is drawn opaque.
class RectangleTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::Rectangle; }
  const char* label() const override { return "Rectangle"; }
  ToolCategory category() const override { return ToolCategory::Shapes; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }
  char shortcut() const override { return 'r'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

// Ellipse inscribed in the box spanned by two corners.
class EllipseTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::Ellipse; }
  const char* label() const override { return "Ellipse"; }
  ToolCategory category() const override { return ToolCategory::Shapes; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }
  char shortcut() const override { return 'e'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

} // namespace tc
