#include "key.hpp"
#include "utf8.hpp"

Key Key::character(char32_t c) { Key k; k.type = Type::Char; k.ch = c; return k; }
Key Key::arrow(Direction d) { Key k; k.type = Type::Arrow; k.dir = d; return k; }
Key Key::function(int n) { Key k; k.type = Type::Function; k.fn = n; return k; }
Key Key::control(ControlKind c) { Key k; k.type = Type::Control; k.ctrl = c; return k; }
Key Key::ctrl_of(char32_t base) { Key k = control(ControlKind::Ctrl); k.ch = base; return k; }
Key Key::alt_of(char32_t base) { Key k = control(ControlKind::Alt); k.ch = base; return k; }
Key Key::special_key(SpecialKind s) { Key k; k.type = Type::Special; k.special = s; return k; }

char32_t ctrl_base(char32_t c) {
  if (c == 0) return U'@';
  if (c >= 1 && c <= 26) return static_cast<char32_t>(U'a' + (c - 1));
  switch (c) {
    case 27: return U'[';
    case 28: return U'\\';
    case 29: return U']';
    case 30: return U'^';
    case 31: return U'_';
    default: return 0;
  }
}

Key key_from_char(char32_t c) {
  switch (c) {
    case 0x1B: return Key::control(ControlKind::Escape);
    case U'\r': return Key::control(ControlKind::CR);
    case U'\n': return Key::control(ControlKind::LF);
    case U'\t': return Key::control(ControlKind::Tab);
    case 0x7F: return Key::control(ControlKind::Delete);
    default: break;
  }
  if (c <= 0x1F) return Key::ctrl_of(ctrl_base(c));
  return Key::character(c);
}

std::u32string key_render(const Key& k, int tab_stop) {
  if (k.type == Key::Type::Char) return std::u32string(1, k.ch);
  if (k.is_control(ControlKind::Tab)) return std::u32string(static_cast<size_t>(tab_stop > 0 ? tab_stop : 1), U' ');
  return std::u32string();
}

size_t key_display_width(const Key& k, int tab_stop) {
  return key_render(k, tab_stop).size();
}

// Inverse of ctrl_base; -1 when the base has no control byte.
static int ctrl_byte(char32_t base) {
  if (base == U'@') return 0;
  if (base >= U'a' && base <= U'z') return static_cast<int>(base - U'a') + 1;
  switch (base) {
    case U'[': return 27;
    case U'\\': return 28;
    case U']': return 29;
    case U'^': return 30;
    case U'_': return 31;
    default: return -1;
  }
}

void append_raw_text(const Key& k, std::string& out) {
  if (k.type == Key::Type::Char) { append_utf8(out, k.ch); return; }
  if (k.type != Key::Type::Control) return;
  switch (k.ctrl) {
    case ControlKind::Tab: out.push_back('\t'); return;
    case ControlKind::LF: out.push_back('\n'); return;
    case ControlKind::CR: out.push_back('\r'); return;
    case ControlKind::Escape: out.push_back('\x1b'); return;
    case ControlKind::Delete: out.push_back('\x7f'); return;
    case ControlKind::Ctrl: {
      int b = ctrl_byte(k.ch);
      if (b >= 0) out.push_back(static_cast<char>(b));
      return;
    }
    default: return;
  }
}

static const char* control_label(ControlKind c) {
  switch (c) {
    case ControlKind::Ctrl: return "Ctrl";
    case ControlKind::Alt: return "Alt";
    case ControlKind::Tab: return "Tab";
    case ControlKind::LF: return "LF";
    case ControlKind::CR: return "CR";
    case ControlKind::Escape: return "Esc";
    case ControlKind::Backspace: return "Backspace";
    case ControlKind::Delete: return "Delete";
    case ControlKind::Home: return "Home";
    case ControlKind::End: return "End";
    case ControlKind::PageUp: return "PageUp";
    case ControlKind::PageDown: return "PageDown";
    case ControlKind::Insert: return "Insert";
  }
  return "?";
}

std::string key_name(const Key& k) {
  std::string out;
  switch (k.type) {
    case Key::Type::Char:
      append_utf8(out, k.ch);
      return out;
    case Key::Type::Arrow: {
      static const char* names[] = {"Up", "Down", "Left", "Right"};
      return names[static_cast<int>(k.dir)];
    }
    case Key::Type::Function:
      return "F" + std::to_string(k.fn);
    case Key::Type::Control:
      out = control_label(k.ctrl);
      if (k.ctrl == ControlKind::Ctrl || k.ctrl == ControlKind::Alt) { out += "+"; append_utf8(out, k.ch); }
      return out;
    case Key::Type::Special: {
      static const char* names[] = {"CapsLock", "NumLock", "ScrollLock", "PrintScreen", "PauseBreak", "Menu"};
      return names[static_cast<int>(k.special)];
    }
  }
  return out;
}
