#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

enum class TextAlign : std::uint8_t { Left = 0, Center, Right };

// 2D raster surface the engine draws through. Only primitive operations;
// hosts back it with a canvas, a software rasterizer, or a recorder.
class RenderSink {
public:
  virtual ~RenderSink() = default;

  virtual void save() = 0;
  virtual void restore() = 0;

  virtual void setStrokeColor(const float rgba[4]) = 0;
  virtual void setFillColor(const float rgba[4]) = 0;
  virtual void setLineWidth(double width) = 0;
  virtual void setLineDash(const std::vector<double>& pattern) = 0;   // empty = solid
  virtual void setGlobalAlpha(double alpha) = 0;
  virtual void setFont(double sizePx, const std::string& family, const std::string& weight) = 0;
  virtual void setTextAlign(TextAlign align) = 0;

  virtual void beginPath() = 0;
  virtual void moveTo(double x, double y) = 0;
  virtual void lineTo(double x, double y) = 0;
  virtual void closePath() = 0;
  virtual void arc(double cx, double cy, double radius, double startAngle, double endAngle) = 0;
  virtual void ellipse(double cx, double cy, double rx, double ry,
                       double rotation, double startAngle, double endAngle) = 0;
  virtual void rect(double x, double y, double w, double h) = 0;

  virtual void stroke() = 0;
  virtual void fill() = 0;

  virtual void fillText(const std::string& text, double x, double y) = 0;
  virtual double measureText(const std::string& text) = 0;
};

} // namespace tc
