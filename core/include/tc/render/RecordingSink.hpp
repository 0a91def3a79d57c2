#pragma once
#include "tc/render/RenderSink.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

enum class RenderOp : std::uint8_t {
  Save = 0, Restore,
  StrokeColor, FillColor, LineWidth, LineDash, GlobalAlpha, Font, TextAlign,
  BeginPath, MoveTo, LineTo, ClosePath, Arc, Ellipse, Rect,
  Stroke, Fill, FillText
};

const char* renderOpName(RenderOp op);

struct RenderCommand {
  RenderOp op;
  std::vector<double> args;
  std::string text;   // FillText string, Font family
};

// RenderSink that records every call. Used by tests and by the replay tool
// to dump a frame as a JSON command list.
class RecordingSink : public RenderSink {
public:
  void save() override;
  void restore() override;
  void setStrokeColor(const float rgba[4]) override;
  void setFillColor(const float rgba[4]) override;
  void setLineWidth(double width) override;
  void setLineDash(const std::vector<double>& pattern) override;
  void setGlobalAlpha(double alpha) override;
  void setFont(double sizePx, const std::string& family, const std::string& weight) override;
  void setTextAlign(TextAlign align) override;
  void beginPath() override;
  void moveTo(double x, double y) override;
  void lineTo(double x, double y) override;
  void closePath() override;
  void arc(double cx, double cy, double radius, double startAngle, double endAngle) override;
  void ellipse(double cx, double cy, double rx, double ry,
               double rotation, double startAngle, double endAngle) override;
  void rect(double x, double y, double w, double h) override;
  void stroke() override;
  void fill() override;
  void fillText(const std::string& text, double x, double y) override;

  // Approximate metrics: 0.6 em per character at the current font size.
  double measureText(const std::string& text) override;

  const std::vector<RenderCommand>& commands() const { return commands_; }
  std::size_t count(RenderOp op) const;
  std::vector<std::string> texts() const;
  void clear();

  // [{"op":"lineTo","args":[x,y]}, ...]
  std::string toJSON() const;

private:
  void push(RenderOp op, std::vector<double> args, std::string text = std::string());

  std::vector<RenderCommand> commands_;
  double fontSize_{14.0};
  std::vector<double> fontStack_;
};

} // namespace tc
