#pragma once
#include "tc/viewport/InputState.hpp"
#include "tc/viewport/ViewportManager.hpp"

namespace tc {

// Keyboard navigation for the viewport.
// Left/Right pan, Up/Down zoom about the centre, Home fits all bars,
// End jumps to the most recent bars keeping the current span.
struct KeyboardNavConfig {
  double panFraction{0.1};     // pan by 10% of the visible span
  double zoomFraction{0.2};    // zoom by 20%
};

class KeyboardNav {
public:
  void setConfig(const KeyboardNavConfig& cfg) { config_ = cfg; }
  const KeyboardNavConfig& config() const { return config_; }

  // Returns true if the key was consumed.
  bool processKey(KeyCode key, ViewportManager& vp) const;

  static void panByFraction(ViewportManager& vp, double fraction);
  static void zoomByFraction(ViewportManager& vp, double fraction);

private:
  KeyboardNavConfig config_;
};

} // namespace tc
