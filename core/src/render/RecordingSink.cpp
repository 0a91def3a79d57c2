#include "tc/render/RecordingSink.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace tc {

const char* renderOpName(RenderOp op) {
  switch (op) {
    case RenderOp::Save:        return "save";
    case RenderOp::Restore:     return "restore";
    case RenderOp::StrokeColor: return "strokeColor";
    case RenderOp::FillColor:   return "fillColor";
    case RenderOp::LineWidth:   return "lineWidth";
    case RenderOp::LineDash:    return "lineDash";
    case RenderOp::GlobalAlpha: return "globalAlpha";
    case RenderOp::Font:        return "font";
    case RenderOp::TextAlign:   return "textAlign";
    case RenderOp::BeginPath:   return "beginPath";
    case RenderOp::MoveTo:      return "moveTo";
    case RenderOp::LineTo:      return "lineTo";
    case RenderOp::ClosePath:   return "closePath";
    case RenderOp::Arc:         return "arc";
    case RenderOp::Ellipse:     return "ellipse";
    case RenderOp::Rect:        return "rect";
    case RenderOp::Stroke:      return "stroke";
    case RenderOp::Fill:        return "fill";
    case RenderOp::FillText:    return "fillText";
  }
  return "unknown";
}

void RecordingSink::push(RenderOp op, std::vector<double> args, std::string text) {
  commands_.push_back(RenderCommand{op, std::move(args), std::move(text)});
}

void RecordingSink::save() {
  fontStack_.push_back(fontSize_);
  push(RenderOp::Save, {});
}

void RecordingSink::restore() {
  if (!fontStack_.empty()) {
    fontSize_ = fontStack_.back();
    fontStack_.pop_back();
  }
  push(RenderOp::Restore, {});
}

void RecordingSink::setStrokeColor(const float rgba[4]) {
  push(RenderOp::StrokeColor, {rgba[0], rgba[1], rgba[2], rgba[3]});
}

void RecordingSink::setFillColor(const float rgba[4]) {
  push(RenderOp::FillColor, {rgba[0], rgba[1], rgba[2], rgba[3]});
}

void RecordingSink::setLineWidth(double width) { push(RenderOp::LineWidth, {width}); }
void RecordingSink::setLineDash(const std::vector<double>& pattern) { push(RenderOp::LineDash, pattern); }
void RecordingSink::setGlobalAlpha(double alpha) { push(RenderOp::GlobalAlpha, {alpha}); }

void RecordingSink::setFont(double sizePx, const std::string& family, const std::string& weight) {
  fontSize_ = sizePx;
  push(RenderOp::Font, {sizePx}, weight + " " + family);
}

void RecordingSink::setTextAlign(TextAlign align) {
  push(RenderOp::TextAlign, {static_cast<double>(align)});
}

void RecordingSink::beginPath() { push(RenderOp::BeginPath, {}); }
void RecordingSink::moveTo(double x, double y) { push(RenderOp::MoveTo, {x, y}); }
void RecordingSink::lineTo(double x, double y) { push(RenderOp::LineTo, {x, y}); }
void RecordingSink::closePath() { push(RenderOp::ClosePath, {}); }

void RecordingSink::arc(double cx, double cy, double radius, double startAngle, double endAngle) {
  push(RenderOp::Arc, {cx, cy, radius, startAngle, endAngle});
}

void RecordingSink::ellipse(double cx, double cy, double rx, double ry,
                            double rotation, double startAngle, double endAngle) {
  push(RenderOp::Ellipse, {cx, cy, rx, ry, rotation, startAngle, endAngle});
}

void RecordingSink::rect(double x, double y, double w, double h) {
  push(RenderOp::Rect, {x, y, w, h});
}

void RecordingSink::stroke() { push(RenderOp::Stroke, {}); }
void RecordingSink::fill() { push(RenderOp::Fill, {}); }

void RecordingSink::fillText(const std::string& text, double x, double y) {
  push(RenderOp::FillText, {x, y}, text);
}

double RecordingSink::measureText(const std::string& text) {
  return static_cast<double>(text.size()) * fontSize_ * 0.6;
}

std::size_t RecordingSink::count(RenderOp op) const {
  std::size_t n = 0;
  for (const auto& c : commands_)
    if (c.op == op) ++n;
  return n;
}

std::vector<std::string> RecordingSink::texts() const {
  std::vector<std::string> out;
  for (const auto& c : commands_)
    if (c.op == RenderOp::FillText) out.push_back(c.text);
  return out;
}

void RecordingSink::clear() {
  commands_.clear();
  fontStack_.clear();
  fontSize_ = 14.0;
}

std::string RecordingSink::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartArray();
  for (const auto& c : commands_) {
    w.StartObject();
    w.Key("op"); w.String(renderOpName(c.op));
    if (!c.args.empty()) {
      w.Key("args");
      w.StartArray();
      for (double a : c.args) w.Double(a);
      w.EndArray();
    }
    if (!c.text.empty()) {
      w.Key("text"); w.String(c.text.c_str());
    }
    w.EndObject();
  }
  w.EndArray();

  return sb.GetString();
}

} // namespace tc
