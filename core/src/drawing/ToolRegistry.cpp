#include "tc/drawing/ToolRegistry.hpp"
#include "tc/debug/Diagnostics.hpp"
#include "tc/drawing/tools/AdvancedTools.hpp"
#include "tc/drawing/tools/ChannelTools.hpp"
#include "tc/drawing/tools/FibTools.hpp"
#include "tc/drawing/tools/LineTools.hpp"
#include "tc/drawing/tools/ShapeTools.hpp"
#include "tc/drawing/tools/TextTool.hpp"

namespace tc {

bool drawingTypeFor(ToolId tool, DrawingType& out) {
  if (tool == ToolId::Select) return false;
  out = static_cast<DrawingType>(tool);
  return true;
}

const char* toolIdName(ToolId tool) {
  DrawingType type;
  if (!drawingTypeFor(tool, type)) return "select";
  return drawingTypeId(type);
}

ToolId parseToolId(const std::string& id, Diagnostics* diag) {
  if (id == "select") return ToolId::Select;
  DrawingType type;
  if (parseDrawingType(id, type)) return toolIdFor(type);
  if (diag) diag->log(LogLevel::Warn, "unknown tool '" + id + "', using select");
  return ToolId::Select;
}

const DrawingTool& toolFor(DrawingType type) {
  static const TrendlineTool trendline;
  static const HorizontalLineTool hline;
  static const VerticalLineTool vline;
  static const RectangleTool rect;
  static const RayTool ray;
  static const ArrowTool arrow;
  static const FibRetracementTool fib;
  static const FibExtensionTool fibExtension;
  static const ParallelChannelTool parallel;
  static const PitchforkTool pitchfork;
  static const GannFanTool gannFan;
  static const EllipseTool ellipse;
  static const VolumeProfileTool volumeProfile;
  static const TextTool text;

  switch (type) {
    case DrawingType::Trendline:       return trendline;
    case DrawingType::HorizontalLine:  return hline;
    case DrawingType::VerticalLine:    return vline;
    case DrawingType::Rectangle:       return rect;
    case DrawingType::Ray:             return ray;
    case DrawingType::Arrow:           return arrow;
    case DrawingType::FibRetracement:  return fib;
    case DrawingType::FibExtension:    return fibExtension;
    case DrawingType::ParallelChannel: return parallel;
    case DrawingType::Pitchfork:       return pitchfork;
    case DrawingType::GannFan:         return gannFan;
    case DrawingType::Ellipse:         return ellipse;
    case DrawingType::VolumeProfile:   return volumeProfile;
    case DrawingType::Text:            return text;
  }
  return trendline;
}

const DrawingTool* toolFor(ToolId tool) {
  DrawingType type;
  if (!drawingTypeFor(tool, type)) return nullptr;
  return &toolFor(type);
}

ToolId toolForShortcut(char key) {
  if (key == 0) return ToolId::Select;
  for (int i = 1; i <= kDrawingTypeCount; ++i) {
    DrawingType type = static_cast<DrawingType>(i);
    if (toolFor(type).shortcut() == key) return toolIdFor(type);
  }
  return ToolId::Select;
}

const std::vector<ToolGroup>& toolCatalogue() {
  static const std::vector<ToolGroup> groups = {
    {ToolCategory::Basic, {ToolId::Trendline, ToolId::HorizontalLine, ToolId::VerticalLine,
                           ToolId::Ray, ToolId::Arrow, ToolId::Text}},
    {ToolCategory::Shapes, {ToolId::Rectangle, ToolId::Ellipse}},
    {ToolCategory::Fibonacci, {ToolId::FibRetracement, ToolId::FibExtension}},
    {ToolCategory::Channels, {ToolId::ParallelChannel, ToolId::Pitchfork}},
    {ToolCategory::Advanced, {ToolId::GannFan, ToolId::VolumeProfile}},
  };
  return groups;
}

} // namespace tc
