#pragma once
#include "tc/drawing/DrawingTool.hpp"

#include <string>
#include <vector>

namespace tc {

struct TextBox {
  double left{0}, top{0}, right{0}, bottom{0};
};

// Single-point text annotation. Placement creates the object with
// placeholder text; the host edits it afterwards through setObjectText.
class TextTool : public DrawingTool {
public:
  static constexpr const char* kPlaceholder = "Text";
  static constexpr int kZIndex = 100;
  static constexpr double kDefaultPadding = 4.0;
  static constexpr double kDefaultLineHeight = 1.4;

  DrawingType type() const override { return DrawingType::Text; }
  const char* label() const override { return "Text"; }
  ToolCategory category() const override { return ToolCategory::Basic; }
  int minPoints() const override { return 1; }
  int maxPoints() const override { return 1; }
  char shortcut() const override { return 'n'; }
  bool autoResetToSelect() const override { return true; }

  DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const override;
  void render(const DrawingObject& obj, RenderContext& rc) const override;
  double hitTest(const DrawingObject& obj, const WorldPoint& p,
                 const CoordinateTransform& xf) const override;

  // Lines as rendered: split on '\n' only when meta.multiline is set.
  static std::vector<std::string> lines(const DrawingObject& obj);

  // Screen box around the text. Widths use the 0.6 em per character
  // estimate so hit testing needs no render sink.
  static TextBox bounds(const DrawingObject& obj, const CoordinateTransform& xf);
};

} // namespace tc
