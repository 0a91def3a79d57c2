#include "tc/viewport/KeyboardNav.hpp"
#include <cmath>

namespace tc {

bool KeyboardNav::processKey(KeyCode key, ViewportManager& vp) const {
  switch (key) {
    case KeyCode::Left:
      panByFraction(vp, -config_.panFraction);
      return true;
    case KeyCode::Right:
      panByFraction(vp, config_.panFraction);
      return true;
    case KeyCode::Up:
      zoomByFraction(vp, config_.zoomFraction);
      return true;
    case KeyCode::Down:
      zoomByFraction(vp, -config_.zoomFraction);
      return true;
    case KeyCode::Home:
      vp.showAll();
      return true;
    case KeyCode::End:
      vp.scrollToLatest();
      return true;
    default:
      return false;
  }
}

void KeyboardNav::panByFraction(ViewportManager& vp, double fraction) {
  const auto& s = vp.state();
  vp.panBy((s.visibleEnd - s.visibleStart) * fraction);
}

void KeyboardNav::zoomByFraction(ViewportManager& vp, double fraction) {
  vp.zoomAt(std::exp(fraction), static_cast<double>(vp.state().widthPx) * 0.5);
}

} // namespace tc
