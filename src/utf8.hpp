#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: scalar checks and encoding of code points for save/draw paths.
 */
#include <cstdint>
#include <string>
#include <string_view>

inline bool is_scalar_value(uint32_t cp) {
  return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

// Leading byte -> total byte count of the unit, 0 if it cannot start one.
inline int utf8_unit_length(uint8_t lead) {
  if ((lead & 0x80) == 0x00) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

inline bool is_continuation_byte(uint8_t b) { return (b & 0xC0) == 0x80; }

void append_utf8(std::string& out, char32_t cp);
std::string to_utf8(std::u32string_view s);
// Lenient decode for display paths; malformed units become U+FFFD.
std::u32string from_utf8(std::string_view s);
