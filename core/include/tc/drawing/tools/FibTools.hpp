#pragma once
#include "tc/drawing/DrawingTool.hpp"

#include <vector>

namespace tc {

// Retracement levels between p0 (0%) and p1 (100%). Levels live in
// meta.fibLevels so users can customise them per object.
class FibRetracementTool : public DrawingTool {
public:
  static const std::vector<double>& defaultLevels();

  DrawingType type() const override { return DrawingType::FibRetracement; }
  const char* label() const override { return "Fib Retracement"; }
  ToolCategory category() const override { return ToolCategory::Fibonacci; }
  int minPoints() const override { return 2; }
  int maxPoints() const override { return 2; }
  char shortcut() const override { return 'f'; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void onComplete(DrawingObject& obj) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;

  // Price of each level for a finished object.
  static std::vector<double> levelPrices(const DrawingObject& obj);
};

// ABC extension: swing p0->p1 projected from p2.
class FibExtensionTool : public DrawingTool {
public:
  static const std::vector<double>& defaultLevels();

  DrawingType type() const override { return DrawingType::FibExtension; }
  const char* label() const override { return "Fib Extension"; }
  ToolCategory category() const override { return ToolCategory::Fibonacci; }
  int minPoints() const override { return 3; }
  int maxPoints() const override { return 3; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void onComplete(DrawingObject& obj) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;

  static std::vector<double> targetPrices(const DrawingObject& obj);
};

} // namespace tc
