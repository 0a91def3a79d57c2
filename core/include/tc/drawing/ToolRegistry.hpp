#pragma once
#include "tc/drawing/DrawingTool.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tc {

class Diagnostics;

// Active tool selection: `select` plus one id per drawing type. Values match
// DrawingType so the two convert by cast.
enum class ToolId : std::uint8_t {
  Select = 0,
  Trendline = static_cast<std::uint8_t>(DrawingType::Trendline),
  HorizontalLine,
  VerticalLine,
  Rectangle,
  Ray,
  Arrow,
  FibRetracement,
  FibExtension,
  ParallelChannel,
  Pitchfork,
  GannFan,
  Ellipse,
  VolumeProfile,
  Text
};

inline ToolId toolIdFor(DrawingType type) { return static_cast<ToolId>(type); }

// False for Select.
bool drawingTypeFor(ToolId tool, DrawingType& out);

// "select" or the drawing type id.
const char* toolIdName(ToolId tool);

// Unknown ids fall back to Select; the fallback is logged when diag is given.
ToolId parseToolId(const std::string& id, Diagnostics* diag = nullptr);

// The singleton behaviour for a drawing type.
const DrawingTool& toolFor(DrawingType type);

// nullptr for Select.
const DrawingTool* toolFor(ToolId tool);

// Tool bound to a lowercase shortcut key, or Select when none.
ToolId toolForShortcut(char key);

struct ToolGroup {
  ToolCategory category;
  std::vector<ToolId> tools;
};

// Toolbar layout: every drawing type appears in exactly one group.
const std::vector<ToolGroup>& toolCatalogue();

} // namespace tc
