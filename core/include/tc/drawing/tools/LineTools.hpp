#pragma once
#include "tc/drawing/DrawingTool.hpp"

namespace tc {

class TrendlineTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::Trendline; }
  const char* label() const override { return "Trend Line"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }
  char shortcut() const override { return 't'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

// Full-width price level.
class HorizontalLineTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::HorizontalLine; }
  const char* label() const override { return "Horizontal Line"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 1; }
  int maxPoints() const override { return 1; }
  char shortcut() const override { return 'h'; }

  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

// Full-height time marker; spans every pane.
class VerticalLineTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::VerticalLine; }
  const char* label() const override { return "Vertical Line"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 1; }
  int maxPoints() const override { return 1; }
  char shortcut() const override { return 'v'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

// Half-line from p0 through p1, extended to the canvas edge.
class RayTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::Ray; }
  const char* label() const override { return "Ray"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }

  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

class ArrowTool : public DrawingTool {
public:
  static constexpr double kHeadLength = 15.0;
  static constexpr double kHeadAngle = 3.14159265358979323846 / 6.0;

  DrawingType type() const override { return DrawingType::Arrow; }
  const char* label() const override { return "Arrow"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }
  char shortcut() const override { return 'a'; }

  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

} // namespace tc
