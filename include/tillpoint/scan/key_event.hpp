#pragma once

#include <cstdint>
#include <string>

namespace tillpoint::scan {

/// What had keyboard focus when the key arrived.
enum class FocusTarget : std::uint8_t {
  None,             // page body, buttons, non-editable widgets
  TextField,
  TextArea,
  ContentEditable,
  TextboxRole,
  ScanField,        // dedicated barcode field of the product form; not treated as editable
};

/// Editable targets keep their keystrokes; scanning ignores them.
[[nodiscard]] constexpr bool is_editable(FocusTarget t) noexcept {
  return t == FocusTarget::TextField || t == FocusTarget::TextArea ||
         t == FocusTarget::ContentEditable || t == FocusTarget::TextboxRole;
}

/// One keydown. key is either a single printable character or a named key
/// such as "Enter", "Shift", "Tab".
struct KeyEvent {
  std::string key;
  FocusTarget target{FocusTarget::None};

  [[nodiscard]] bool is_enter() const noexcept { return key == "Enter"; }
  [[nodiscard]] bool is_character() const noexcept { return key.size() == 1; }
};

[[nodiscard]] inline KeyEvent key_char(char c, FocusTarget target = FocusTarget::None) {
  return KeyEvent{std::string(1, c), target};
}

[[nodiscard]] inline KeyEvent key_enter(FocusTarget target = FocusTarget::None) {
  return KeyEvent{"Enter", target};
}

}  // namespace tillpoint::scan
