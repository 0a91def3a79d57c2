#include "tc/drawing/tools/TextTool.hpp"

#include <algorithm>

namespace tc {

static constexpr double kCharWidthEm = 0.6;

DrawingObject TextTool::onStart(const WorldPoint& p, const DrawingStyle& baseStyle) const {
  DrawingObject obj = DrawingTool::onStart(p, baseStyle);
  obj.zIndex = kZIndex;
  obj.meta["text"] = MetaValue::ofText(kPlaceholder);
  obj.meta["padding"] = MetaValue::ofNumber(kDefaultPadding);
  obj.meta["lineHeight"] = MetaValue::ofNumber(kDefaultLineHeight);
  obj.meta["multiline"] = MetaValue::ofFlag(false);
  return obj;
}

std::vector<std::string> TextTool::lines(const DrawingObject& obj) {
  std::vector<std::string> out;
  std::string text = obj.metaText("text");
  if (text.empty()) return out;

  auto it = obj.meta.find("multiline");
  bool multiline = it != obj.meta.end() && it->second.kind == MetaValue::Kind::Flag &&
                   it->second.flag;
  if (!multiline) {
    out.push_back(text);
    return out;
  }

  std::size_t start = 0;
  while (true) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

TextBox TextTool::bounds(const DrawingObject& obj, const CoordinateTransform& xf) {
  TextBox box;
  if (obj.points.empty()) return box;
  ScreenPoint anchor = xf.worldToScreen(obj.points[0]);

  double fontSize = obj.style.fontSize > 0.0 ? obj.style.fontSize : 14.0;
  double pad = obj.metaNumber("padding", kDefaultPadding);
  double lineHeight = obj.metaNumber("lineHeight", kDefaultLineHeight);

  std::vector<std::string> rows = lines(obj);
  std::size_t widest = 0;
  for (const std::string& r : rows) widest = std::max(widest, r.size());
  double textW = static_cast<double>(widest) * fontSize * kCharWidthEm;
  double totalH = static_cast<double>(rows.size()) * fontSize * lineHeight;

  box.left = anchor.x - pad;
  box.top = anchor.y - fontSize - pad;
  box.right = anchor.x + textW + pad;
  box.bottom = anchor.y + totalH - fontSize + pad;
  return box;
}

void TextTool::render(const DrawingObject& obj, RenderContext& rc) const {
  if (obj.points.empty()) return;
  std::vector<std::string> rows = lines(obj);
  if (rows.empty()) return;

  ScreenPoint anchor = rc.xf.worldToScreen(obj.points[0]);
  double fontSize = obj.style.fontSize > 0.0 ? obj.style.fontSize : 14.0;
  double step = fontSize * obj.metaNumber("lineHeight", kDefaultLineHeight);

  rc.sink.save();

  std::string background = obj.metaText("backgroundColor");
  std::string border = obj.metaText("borderColor");
  if (!background.empty() || !border.empty() || rc.selected) {
    TextBox box = bounds(obj, rc.xf);
    if (!background.empty()) {
      applyFill(rc, background, obj.style.opacity);
      rc.sink.beginPath();
      rc.sink.rect(box.left, box.top, box.right - box.left, box.bottom - box.top);
      rc.sink.fill();
    }
    if (!border.empty() || rc.selected) {
      DrawingStyle frame = obj.style;
      frame.color = border.empty() ? obj.style.color : border;
      frame.lineWidth = 1.0;
      frame.lineStyle = border.empty() ? LineStyle::Dashed : LineStyle::Solid;
      applyStrokeStyle(rc, frame);
      rc.sink.beginPath();
      rc.sink.rect(box.left, box.top, box.right - box.left, box.bottom - box.top);
      rc.sink.stroke();
    }
  }

  applyFill(rc, obj.style.color, obj.style.opacity);
  rc.sink.setFont(fontSize, obj.style.fontFamily, obj.style.fontWeight);
  rc.sink.setTextAlign(TextAlign::Left);
  for (std::size_t i = 0; i < rows.size(); ++i)
    rc.sink.fillText(rows[i], anchor.x, anchor.y + step * static_cast<double>(i));

  rc.sink.restore();
}

double TextTool::hitTest(const DrawingObject& obj, const WorldPoint& p,
                         const CoordinateTransform& xf) const {
  if (obj.points.empty() || obj.metaText("text").empty()) return kNoHit;
  TextBox box = bounds(obj, xf);
  return pointToRectDistance(xf.worldToScreen(p), ScreenPoint{box.left, box.top},
                             ScreenPoint{box.right, box.bottom});
}

} // namespace tc
