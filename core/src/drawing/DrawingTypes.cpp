#include "tc/drawing/DrawingTypes.hpp"

namespace tc {

const char* drawingTypeId(DrawingType type) {
  switch (type) {
    case DrawingType::Trendline:       return "trendline";
    case DrawingType::HorizontalLine:  return "hline";
    case DrawingType::VerticalLine:    return "vline";
    case DrawingType::Rectangle:       return "rect";
    case DrawingType::Ray:             return "ray";
    case DrawingType::Arrow:           return "arrow";
    case DrawingType::FibRetracement:  return "fib";
    case DrawingType::FibExtension:    return "fib_extension";
    case DrawingType::ParallelChannel: return "parallel";
    case DrawingType::Pitchfork:       return "pitchfork";
    case DrawingType::GannFan:         return "gann_fan";
    case DrawingType::Ellipse:         return "ellipse";
    case DrawingType::VolumeProfile:   return "volume_profile";
    case DrawingType::Text:            return "text";
  }
  return "trendline";
}

bool parseDrawingType(const std::string& id, DrawingType& out) {
  for (int i = 1; i <= kDrawingTypeCount; ++i) {
    auto t = static_cast<DrawingType>(i);
    if (id == drawingTypeId(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

const char* paneIdName(PaneId pane) {
  switch (pane) {
    case PaneId::Price:  return "price";
    case PaneId::Volume: return "volume";
    case PaneId::Full:   return "full";
  }
  return "price";
}

bool parsePaneId(const std::string& name, PaneId& out) {
  if (name == "price")  { out = PaneId::Price;  return true; }
  if (name == "volume") { out = PaneId::Volume; return true; }
  if (name == "full")   { out = PaneId::Full;   return true; }
  return false;
}

const char* lineStyleName(LineStyle style) {
  switch (style) {
    case LineStyle::Solid:  return "solid";
    case LineStyle::Dashed: return "dashed";
    case LineStyle::Dotted: return "dotted";
  }
  return "solid";
}

bool parseLineStyle(const std::string& name, LineStyle& out) {
  if (name == "solid")                    { out = LineStyle::Solid;  return true; }
  if (name == "dashed" || name == "dash") { out = LineStyle::Dashed; return true; }
  if (name == "dotted" || name == "dot")  { out = LineStyle::Dotted; return true; }
  return false;
}

bool operator==(const DrawingStyle& a, const DrawingStyle& b) {
  return a.color == b.color && a.lineWidth == b.lineWidth &&
         a.lineStyle == b.lineStyle && a.fillColor == b.fillColor &&
         a.opacity == b.opacity && a.fontSize == b.fontSize &&
         a.fontFamily == b.fontFamily && a.fontWeight == b.fontWeight;
}

MetaValue MetaValue::ofNumber(double v) {
  MetaValue m;
  m.kind = Kind::Number;
  m.number = v;
  return m;
}

MetaValue MetaValue::ofText(const std::string& v) {
  MetaValue m;
  m.kind = Kind::Text;
  m.text = v;
  return m;
}

MetaValue MetaValue::ofFlag(bool v) {
  MetaValue m;
  m.kind = Kind::Flag;
  m.flag = v;
  return m;
}

MetaValue MetaValue::ofNumbers(const std::vector<double>& v) {
  MetaValue m;
  m.kind = Kind::NumberList;
  m.numbers = v;
  return m;
}

bool operator==(const MetaValue& a, const MetaValue& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case MetaValue::Kind::Number:     return a.number == b.number;
    case MetaValue::Kind::Text:       return a.text == b.text;
    case MetaValue::Kind::Flag:       return a.flag == b.flag;
    case MetaValue::Kind::NumberList: return a.numbers == b.numbers;
  }
  return false;
}

std::string DrawingObject::metaText(const std::string& key, const std::string& fallback) const {
  auto it = meta.find(key);
  if (it == meta.end() || it->second.kind != MetaValue::Kind::Text) return fallback;
  return it->second.text;
}

double DrawingObject::metaNumber(const std::string& key, double fallback) const {
  auto it = meta.find(key);
  if (it == meta.end() || it->second.kind != MetaValue::Kind::Number) return fallback;
  return it->second.number;
}

std::vector<double> DrawingObject::metaNumbers(const std::string& key) const {
  auto it = meta.find(key);
  if (it == meta.end() || it->second.kind != MetaValue::Kind::NumberList) return {};
  return it->second.numbers;
}

bool operator==(const DrawingObject& a, const DrawingObject& b) {
  return a.id == b.id && a.type == b.type && a.paneId == b.paneId &&
         a.points == b.points && a.style == b.style &&
         a.locked == b.locked && a.visible == b.visible &&
         a.zIndex == b.zIndex && a.meta == b.meta;
}

const char* interactionModeName(InteractionMode mode) {
  switch (mode) {
    case InteractionMode::Idle:     return "idle";
    case InteractionMode::Drawing:  return "drawing";
    case InteractionMode::Editing:  return "editing";
    case InteractionMode::Resizing: return "resizing";
    case InteractionMode::Panning:  return "panning";
  }
  return "idle";
}

} // namespace tc
