#include "tc/style/Theme.hpp"

namespace tc {

static void setColor(float dst[4], float r, float g, float b, float a) {
  dst[0] = r; dst[1] = g; dst[2] = b; dst[3] = a;
}

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // Struct initializers are the dark palette.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  setColor(t.backgroundColor, 0.95f, 0.95f, 0.96f, 1.0f);
  setColor(t.candleUp, 0.1f, 0.7f, 0.3f, 1.0f);
  setColor(t.candleDown, 0.85f, 0.15f, 0.15f, 1.0f);
  setColor(t.gridColor, 0.85f, 0.85f, 0.87f, 1.0f);
  setColor(t.labelColor, 0.2f, 0.2f, 0.25f, 1.0f);

  setColor(t.overlayColors[0], 0.2f, 0.4f, 0.9f, 1.0f);
  setColor(t.overlayColors[1], 0.9f, 0.5f, 0.0f, 1.0f);
  setColor(t.overlayColors[2], 0.0f, 0.6f, 0.6f, 1.0f);
  setColor(t.overlayColors[3], 0.8f, 0.2f, 0.5f, 1.0f);

  setColor(t.volumeUp, 0.1f, 0.6f, 0.3f, 0.5f);
  setColor(t.volumeDown, 0.7f, 0.15f, 0.15f, 0.5f);
  return t;
}

bool findTheme(const std::string& name, Theme& out) {
  if (name == "Dark") {
    out = darkTheme();
    return true;
  }
  if (name == "Light") {
    out = lightTheme();
    return true;
  }
  return false;
}

} // namespace tc
