#include "tc/drawing/DrawingTool.hpp"

namespace tc {

const char* toolCategoryName(ToolCategory category) {
  switch (category) {
    case ToolCategory::Basic:     return "basic";
    case ToolCategory::Shapes:    return "shapes";
    case ToolCategory::Fibonacci: return "fibonacci";
    case ToolCategory::Channels:  return "channels";
    case ToolCategory::Advanced:  return "advanced";
  }
  return "basic";
}

DrawingObject DrawingTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj;
  obj.type = type();
  obj.style = baseStyle;
  obj.points.push_back(p);
  return obj;
}

void DrawingTool::onUpdate(DrawingObject& draft, const WorldPoint& p) const {
  if (draft.points.empty()) {
    draft.points.push_back(p);
    return;
  }
  if (maxPoints() == 1) {
    draft.points[0] = p;
    return;
  }
  if (draft.points.size() < 2)
    draft.points.push_back(p);
  else
    draft.points.back() = p;
}

void DrawingTool::onComplete(DrawingObject& obj) const {
  (void)obj;
}

} // namespace tc
