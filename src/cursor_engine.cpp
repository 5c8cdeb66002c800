#include "cursor_engine.hpp"
#include <algorithm>
#include <string>

void CursorEngine::set_window(size_t text_rows, size_t text_cols) {
  vp.max_row = std::max<size_t>(1, text_rows);
  vp.max_col = std::max<size_t>(1, text_cols);
  scroll_into_view();
}

size_t CursorEngine::row_len(const std::vector<Row>& rows) const {
  return cur.cy < rows.size() ? rows[cur.cy].display_len() : 0;
}

void CursorEngine::move_right(const std::vector<Row>& rows) {
  if (cur.cy >= rows.size()) { cur.cx = 0; return; }
  const Row& row = rows[cur.cy];
  size_t len = row.display_len();
  if (cur.cx < len) {
    // jump over the whole key under the cursor
    size_t idx = row.get_raw_index(cur.cx);
    cur.cx = row.get_render_index(idx).second;
    if (cur.cx >= vp.col_offset + vp.max_col) vp.col_offset = cur.cx + 1 - vp.max_col;
    return;
  }
  if (cur.cy + 1 < rows.size()) {
    move_down(rows);
    cur.cx = 0;
    vp.col_offset = 0;
  }
}

void CursorEngine::move_left(const std::vector<Row>& rows) {
  if (cur.cx > 0 && cur.cy < rows.size()) {
    const Row& row = rows[cur.cy];
    size_t idx = row.get_raw_index(cur.cx - 1);
    cur.cx = row.get_render_index(idx).first;
    if (cur.cx < vp.col_offset) vp.col_offset = cur.cx;
    return;
  }
  if (cur.cy > 0) {
    move_up(rows);
    end(rows);
  }
}

void CursorEngine::move_down(const std::vector<Row>& rows) {
  if (cur.cy + 1 < rows.size()) {
    cur.cy++;
    if (cur.cy >= vp.row_offset + vp.max_row) vp.row_offset = cur.cy + 1 - vp.max_row;
  }
  clamp_x(rows);
}

void CursorEngine::move_up(const std::vector<Row>& rows) {
  if (cur.cy > 0) {
    cur.cy--;
    if (cur.cy < vp.row_offset) vp.row_offset = cur.cy;
  }
  clamp_x(rows);
}

void CursorEngine::clamp_x(const std::vector<Row>& rows) {
  size_t len = row_len(rows);
  if (len <= vp.max_col) vp.col_offset = 0;
  if (len == 0) { cur.cx = 0; return; }
  if (cur.cx > len) cur.cx = len;
  // the old column may fall inside a tab on the new row
  if (cur.cx < len) cur.cx = rows[cur.cy].get_render_index(rows[cur.cy].get_raw_index(cur.cx)).first;
  if (cur.cx < vp.col_offset) vp.col_offset = cur.cx;
}

void CursorEngine::home() {
  cur.cx = 0;
  vp.col_offset = 0;
}

void CursorEngine::end(const std::vector<Row>& rows) {
  size_t len = row_len(rows);
  cur.cx = len;
  // the cursor may rest one past the last character
  if (len >= vp.max_col) vp.col_offset = len + 1 - vp.max_col;
  else vp.col_offset = 0;
}

void CursorEngine::page_up(const std::vector<Row>& rows) {
  for (size_t i = 0; i < vp.max_row && cur.cy > 0; ++i) move_up(rows);
}

void CursorEngine::page_down(const std::vector<Row>& rows) {
  for (size_t i = 0; i < vp.max_row && cur.cy + 1 < rows.size(); ++i) move_down(rows);
}

void CursorEngine::step_left(size_t width) {
  cur.cx = cur.cx > width ? cur.cx - width : 0;
  if (cur.cx < vp.col_offset) vp.col_offset = cur.cx;
}

void CursorEngine::scroll_into_view() {
  if (cur.cy < vp.row_offset) vp.row_offset = cur.cy;
  else if (cur.cy >= vp.row_offset + vp.max_row) vp.row_offset = cur.cy + 1 - vp.max_row;
  if (cur.cx < vp.col_offset) vp.col_offset = cur.cx;
  else if (cur.cx >= vp.col_offset + vp.max_col) vp.col_offset = cur.cx + 1 - vp.max_col;
}

bool CursorEngine::search(const std::vector<Row>& rows, std::span<const Key> query) {
  for (size_t i = 0; i < rows.size(); ++i) {
    const auto& raw = rows[i].raw();
    size_t pos = find_key_subsequence(raw, query);
    if (pos == std::string::npos) continue;
    cur.cy = i;
    cur.cx = rows[i].get_render_index(pos).first;
    scroll_into_view();
    return true;
  }
  return false;
}
