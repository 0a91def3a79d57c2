#pragma once
#include "tc/drawing/DrawingTool.hpp"

namespace tc {

// p0->p1 is the base line; p2 anchors the parallel copy.
class ParallelChannelTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::ParallelChannel; }
  const char* label() const override { return "Parallel Channel"; }
  ToolCategory category() const override { return ToolCategory::Channels; }
  int minPoints() const override { return 3; }
  int maxPoints() const override { return 3; }
  char shortcut() const override { return 'p'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;

  // Fourth corner: p2 + (p1 - p0), in world space.
  static WorldPoint oppositeCorner(const DrawingObject& obj);
};

// Andrews pitchfork: handle p0, swing points p1 and p2.
class PitchforkTool : public DrawingTool {
public:
  DrawingType type() const override { return DrawingType::Pitchfork; }
  const char* label() const override { return "Pitchfork"; }
  ToolCategory category() const override { return ToolCategory::Channels; }
  int minPoints() const override { return 3; }
  int maxPoints() const override { return 3; }

  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

} // namespace tc
