#pragma once
#include "tc/drawing/DrawingTool.hpp"

#include <vector>

namespace tc {

// Fan of rays from p0 at the Gann ratios in meta.angles. p1 only decides
// whether the fan opens upward or downward on screen.
class GannFanTool : public DrawingTool {
public:
  static const std::vector<double>& defaultRatios();

  DrawingType type() const override { return DrawingType::GannFan; }
  const char* label() const override { return "Gann Fan"; }
  ToolCategory category() const override { return ToolCategory::Advanced; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

// Volume-at-price histogram for the bars inside the p0/p1 box, drawn to
// the right of the box.
class VolumeProfileTool : public DrawingTool {
public:
  static constexpr int kDefaultBins = 24;
  static constexpr int kMaxBins = 512;
  static constexpr double kMaxBarWidthPx = 200.0;

  // meta.bins clamped to [1, kMaxBins]; missing or non-finite gives kDefaultBins.
  static int binCount(const DrawingObject& obj);

  DrawingType type() const override { return DrawingType::VolumeProfile; }
  const char* label() const override { return "Volume Profile"; }
  ToolCategory category() const override { return ToolCategory::Advanced; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;
};

} // namespace tc
