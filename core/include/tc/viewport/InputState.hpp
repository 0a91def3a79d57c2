#pragma once
#include <cstdint>

namespace tc {

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, Up, Down, Home, End,
  Escape, Delete, Backspace, Enter,
  Character   // printable key; see KeyEvent::ch
};

// Generic key event, NOT toolkit-specific. Hosts translate their native
// events into this before handing them to the engine.
struct KeyEvent {
  KeyCode code{KeyCode::None};
  char ch{0};          // lower-case character for KeyCode::Character
  bool ctrl{false};
  bool shift{false};
  bool alt{false};
  bool meta{false};    // Cmd on macOS; treated like ctrl for shortcuts
};

inline KeyEvent keyChar(char c, bool ctrl = false, bool shift = false) {
  KeyEvent e;
  e.code = KeyCode::Character;
  e.ch = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  e.ctrl = ctrl;
  e.shift = shift || (c >= 'A' && c <= 'Z');
  return e;
}

inline KeyEvent keyCode(KeyCode code) {
  KeyEvent e;
  e.code = code;
  return e;
}

} // namespace tc
