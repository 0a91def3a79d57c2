#pragma once
#include <string>

namespace tc {

// Colours for the main chart. Drawing objects carry their own style.
struct Theme {
  std::string name;

  float backgroundColor[4] = {0.1f, 0.1f, 0.12f, 1.0f};

  float candleUp[4] = {0.0f, 0.8f, 0.4f, 1.0f};
  float candleDown[4] = {0.9f, 0.2f, 0.2f, 1.0f};

  float gridColor[4] = {0.2f, 0.2f, 0.25f, 1.0f};
  float labelColor[4] = {0.7f, 0.7f, 0.75f, 1.0f};
  double gridLineWidth{1.0};

  // Indicator overlays, used round-robin
  float overlayColors[4][4] = {
    {0.3f, 0.5f, 1.0f, 1.0f},  // blue
    {1.0f, 0.6f, 0.0f, 1.0f},  // orange
    {0.0f, 0.8f, 0.8f, 1.0f},  // cyan
    {1.0f, 0.3f, 0.7f, 1.0f}   // pink
  };

  float volumeUp[4] = {0.0f, 0.6f, 0.3f, 0.6f};
  float volumeDown[4] = {0.7f, 0.15f, 0.15f, 0.6f};
};

Theme darkTheme();
Theme lightTheme();

// "Dark" or "Light" (case-sensitive). False leaves `out` untouched.
bool findTheme(const std::string& name, Theme& out);

} // namespace tc
