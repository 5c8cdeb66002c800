#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows > 0 ? rows : 1;
  cols_ = cols > 0 ? cols : 1;
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(static_cast<size_t>(rows_), std::u32string(static_cast<size_t>(cols_), U' '));
  reversed_.assign(static_cast<size_t>(rows_), false);
}

void HeadlessTerminal::put(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  std::u32string s = from_utf8(text);
  auto& line = grid_[static_cast<size_t>(row)];
  for (size_t i = 0; i < s.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;  // ncurses clips at the right edge the same way
    line[static_cast<size_t>(c)] = s[i];
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text);
}

void HeadlessTerminal::draw_reversed(int row, int col, const std::string& text) {
  put(row, col, text);
  if (row >= 0 && row < rows_) reversed_[static_cast<size_t>(row)] = true;
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  auto& line = grid_[static_cast<size_t>(row)];
  for (int c = col < 0 ? 0 : col; c < cols_; ++c) line[static_cast<size_t>(c)] = U' ';
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::u32string s = grid_[static_cast<size_t>(row)];
  while (!s.empty() && s.back() == U' ') s.pop_back();
  return to_utf8(s);
}

bool HeadlessTerminal::reversed(int row) const {
  return row >= 0 && row < rows_ && reversed_[static_cast<size_t>(row)];
}
