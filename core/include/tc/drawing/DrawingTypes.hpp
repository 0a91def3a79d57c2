#pragma once
#include "tc/math/Geometry.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tc {

// Closed set of annotation kinds. Values are stable; the wire format uses
// the string ids from drawingTypeId().
enum class DrawingType : std::uint8_t {
  Trendline = 1,
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

inline constexpr int kDrawingTypeCount = 14;

const char* drawingTypeId(DrawingType type);
bool parseDrawingType(const std::string& id, DrawingType& out);

enum class PaneId : std::uint8_t { Price = 0, Volume, Full };

const char* paneIdName(PaneId pane);
bool parsePaneId(const std::string& name, PaneId& out);

enum class LineStyle : std::uint8_t { Solid = 0, Dashed, Dotted };

const char* lineStyleName(LineStyle style);
bool parseLineStyle(const std::string& name, LineStyle& out);

struct DrawingStyle {
  std::string color{"#0EA5E9"};
  double lineWidth{2.0};
  LineStyle lineStyle{LineStyle::Solid};
  std::string fillColor;          // empty = no fill
  double opacity{1.0};
  double fontSize{14.0};
  std::string fontFamily{"sans-serif"};
  std::string fontWeight{"normal"};
};

bool operator==(const DrawingStyle& a, const DrawingStyle& b);
inline bool operator!=(const DrawingStyle& a, const DrawingStyle& b) { return !(a == b); }

// Value in an object's type-specific key/value bag.
struct MetaValue {
  enum class Kind : std::uint8_t { Number = 0, Text, Flag, NumberList };

  Kind kind{Kind::Number};
  double number{0};
  std::string text;
  bool flag{false};
  std::vector<double> numbers;

  static MetaValue ofNumber(double v);
  static MetaValue ofText(const std::string& v);
  static MetaValue ofFlag(bool v);
  static MetaValue ofNumbers(const std::vector<double>& v);
};

bool operator==(const MetaValue& a, const MetaValue& b);
inline bool operator!=(const MetaValue& a, const MetaValue& b) { return !(a == b); }

using MetaBag = std::map<std::string, MetaValue>;

struct DrawingObject {
  std::string id;
  DrawingType type{DrawingType::Trendline};
  PaneId paneId{PaneId::Price};
  std::vector<WorldPoint> points;
  DrawingStyle style;
  bool locked{false};
  bool visible{true};
  int zIndex{0};
  MetaBag meta;

  // Convenience accessors for meta; return the fallback when absent or of
  // another kind.
  std::string metaText(const std::string& key, const std::string& fallback = std::string()) const;
  double metaNumber(const std::string& key, double fallback) const;
  std::vector<double> metaNumbers(const std::string& key) const;
};

bool operator==(const DrawingObject& a, const DrawingObject& b);
inline bool operator!=(const DrawingObject& a, const DrawingObject& b) { return !(a == b); }

// Full-pane objects show on every pane.
inline bool onPane(const DrawingObject& obj, PaneId pane) {
  return obj.paneId == pane || obj.paneId == PaneId::Full;
}

// Exactly one active at a time; owned by the engine, never persisted.
enum class InteractionMode : std::uint8_t {
  Idle = 0, Drawing, Editing, Resizing, Panning
};

const char* interactionModeName(InteractionMode mode);

} // namespace tc
