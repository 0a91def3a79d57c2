#pragma once
#include "tc/drawing/DrawingTypes.hpp"
#include "tc/render/RenderContext.hpp"
#include "tc/viewport/CoordinateTransform.hpp"

#include <cstdint>
#include <limits>

namespace tc {

enum class ToolCategory : std::uint8_t {
  Basic = 0, Shapes, Fibonacci, Channels, Advanced
};

const char* toolCategoryName(ToolCategory category);

inline constexpr double kNoHit = std::numeric_limits<double>::infinity();

// Behaviour of one annotation kind. Implementations are stateless
// singletons handed out by toolFor().
//
// Drafting protocol:
//   onStart    -> draft holding the first point
//   onUpdate   -> appends the second point, then moves the trailing point
//   onComplete -> post-processing once the point count is satisfied
class DrawingTool {
public:
  virtual ~DrawingTool() = default;

  virtual DrawingType type() const = 0;
  virtual const char* label() const = 0;
  virtual ToolCategory category() const = 0;
  virtual int minPoints() const = 0;
  virtual int maxPoints() const = 0;

  // 0 when the tool has no keyboard shortcut.
  virtual char shortcut() const { return 0; }

  // Single-use tools hand control back to `select` after completion.
  virtual bool autoResetToSelect() const { return false; }

  virtual DrawingObject onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const;
  virtual void onUpdate(DrawingObject& draft, const WorldPoint& p) const;
  virtual void onComplete(DrawingObject& obj) const;

  virtual void render(const DrawingObject& obj, RenderContext& rc) const = 0;

  // Pixel distance from `p` to the object's body; kNoHit when the object
  // cannot be hit there.
  virtual double hitTest(const DrawingObject& obj, const WorldPoint& p,
                         const CoordinateTransform& xf) const = 0;

  const char* id() const { return drawingTypeId(type()); }
};

} // namespace tc
