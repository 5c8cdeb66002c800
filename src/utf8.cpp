#include "utf8.hpp"

void append_utf8(std::string& out, char32_t cp) {
  uint32_t c = static_cast<uint32_t>(cp);
  if (!is_scalar_value(c)) c = 0xFFFD;
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

std::string to_utf8(std::u32string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char32_t c : s) append_utf8(out, c);
  return out;
}

std::u32string from_utf8(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    uint8_t lead = static_cast<uint8_t>(s[i]);
    int n = utf8_unit_length(lead);
    if (n == 0 || i + static_cast<size_t>(n) > s.size()) { out.push_back(0xFFFD); ++i; continue; }
    uint32_t cp = lead & (0xFFu >> (n + 1));
    if (n == 1) cp = lead;
    bool good = true;
    for (int k = 1; k < n; ++k) {
      uint8_t b = static_cast<uint8_t>(s[i + k]);
      if (!is_continuation_byte(b)) { good = false; break; }
      cp = (cp << 6) | (b & 0x3F);
    }
    if (!good || !is_scalar_value(cp)) { out.push_back(0xFFFD); ++i; continue; }
    out.push_back(static_cast<char32_t>(cp));
    i += static_cast<size_t>(n);
  }
  return out;
}
