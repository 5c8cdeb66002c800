#pragma once
/*
 * Key
 *
 * Purpose: immutable semantic key event produced by KeyParser and stored
 * as the raw form of a Row.
 * Rendering: key_render is the single source of a key's display text;
 * key_display_width is derived from it so insert/backspace/index mapping
 * never disagree.
 */
#include <cstddef>
#include <string>

enum class Direction { Up, Down, Left, Right };

enum class ControlKind {
  Ctrl, Alt, Tab, LF, CR, Escape, Backspace, Delete, Home, End, PageUp, PageDown, Insert
};

// lock/media keys, informational only
enum class SpecialKind { CapsLock, NumLock, ScrollLock, PrintScreen, PauseBreak, Menu };

struct Key {
  enum class Type { Char, Arrow, Function, Control, Special };
  Type type = Type::Char;
  char32_t ch = 0;  // Char, and the base character of Ctrl/Alt
  Direction dir = Direction::Up;
  int fn = 0;
  ControlKind ctrl = ControlKind::Escape;
  SpecialKind special = SpecialKind::CapsLock;

  bool operator==(const Key&) const = default;

  static Key character(char32_t c);
  static Key arrow(Direction d);
  static Key function(int n);
  static Key control(ControlKind k);
  static Key ctrl_of(char32_t base);
  static Key alt_of(char32_t base);
  static Key special_key(SpecialKind k);

  bool is_control(ControlKind k) const { return type == Type::Control && ctrl == k; }
  bool is_ctrl(char32_t base) const { return type == Type::Control && ctrl == ControlKind::Ctrl && ch == base; }
};

// Literal character outside an escape sequence -> key.
Key key_from_char(char32_t c);
// Reverse of the Ctrl transform for 0x00..0x1F; 0 for anything else.
char32_t ctrl_base(char32_t c);

std::u32string key_render(const Key& k, int tab_stop);
size_t key_display_width(const Key& k, int tab_stop);
// Bytes the key contributes to a saved file; navigation keys give none.
void append_raw_text(const Key& k, std::string& out);
std::string key_name(const Key& k);
