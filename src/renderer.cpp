#include "renderer.hpp"
#include <algorithm>
#include <sstream>
#include "config.hpp"
#include "utf8.hpp"

std::string Renderer::welcome_text() { return std::string("keyed -- version: ") + KEYED_VERSION; }

std::string Renderer::status_line(const Frame& f) {
  std::ostringstream oss;
  oss << (f.file_name.empty() ? "[No Name]" : f.file_name)
      << (f.modified ? "(modified)" : "")
      << " Ln " << (f.cur.cy + 1) << "/" << (f.rows ? f.rows->size() : 0)
      << ", Col " << (f.cur.cx + 1);
  return oss.str();
}

// pads or truncates to exactly `cols` cells
static std::string fit(std::u32string s, size_t cols) {
  if (s.size() > cols) s.resize(cols);
  else s.append(cols - s.size(), U' ');
  return to_utf8(s);
}

void Renderer::render(ITerminal& term, const Frame& f) {
  TermSize sz = term.getSize();
  int cols = std::max(1, sz.cols);
  const std::vector<Row>& rows = *f.rows;
  const Viewport& vp = f.vp;
  term.clear();
  int text_rows = static_cast<int>(vp.max_row);
  for (int i = 0; i < text_rows; ++i) {
    size_t idx = vp.row_offset + static_cast<size_t>(i);
    if (idx < rows.size()) {
      const std::u32string& r = rows[idx].rendered();
      if (vp.col_offset < r.size()) {
        size_t n = std::min(vp.max_col, r.size() - vp.col_offset);
        term.draw_text(i, 0, to_utf8(std::u32string_view(r).substr(vp.col_offset, n)));
      }
    } else {
      term.draw_text(i, 0, "~");
    }
    if (rows.empty() && f.file_name.empty() && i + 1 == text_rows / 3) {
      std::string w = welcome_text();
      if (w.size() > static_cast<size_t>(cols)) w.resize(static_cast<size_t>(cols));
      int margin = (cols - static_cast<int>(w.size())) / 2;
      term.draw_text(i, margin, w);
    }
  }
  term.draw_reversed(text_rows, 0, fit(from_utf8(status_line(f)), static_cast<size_t>(cols)));
  // expiry is only noticed on the next redraw, i.e. after the next key
  if (f.message && !f.message->text.empty() && !f.message->expired()) {
    term.draw_reversed(text_rows + 1, 0, fit(from_utf8(f.message->text), static_cast<size_t>(cols)));
  } else {
    term.clear_to_eol(text_rows + 1, 0);
  }
  if (f.mode == Mode::Search) {
    int c = std::min(static_cast<int>(f.prompt_col), cols - 1);
    term.move_cursor(text_rows + 1, c);
  } else {
    int r = static_cast<int>(f.cur.cy - std::min(f.cur.cy, vp.row_offset));
    int c = static_cast<int>(f.cur.cx - std::min(f.cur.cx, vp.col_offset));
    term.move_cursor(r, std::min(c, cols - 1));
  }
  term.refresh();
}
