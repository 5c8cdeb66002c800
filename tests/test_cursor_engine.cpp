#include "cursor_engine.hpp"
#include <cassert>
#include <string>
#include <vector>

static Row row_of(std::u32string_view s, int tab_stop = 4) {
  std::vector<Key> ks;
  for (char32_t c : s) ks.push_back(key_from_char(c));
  return Row(std::move(ks), tab_stop);
}

static std::vector<Key> keys(std::u32string_view s) {
  std::vector<Key> out;
  for (char32_t c : s) out.push_back(key_from_char(c));
  return out;
}

static void test_horizontal_moves_skip_tabs() {
  std::vector<Row> rows{row_of(U"a\tb"), row_of(U"xy")};
  CursorEngine e;
  e.set_window(10, 80);
  e.move_right(rows);
  assert(e.cur.cx == 1);
  e.move_right(rows);
  assert(e.cur.cx == 5);
  e.move_left(rows);
  assert(e.cur.cx == 1);
  e.end(rows);
  assert(e.cur.cx == 6);
  // wraps to the next row
  e.move_right(rows);
  assert(e.cur.cy == 1 && e.cur.cx == 0);
  // and back to the end of the previous one
  e.move_left(rows);
  assert(e.cur.cy == 0 && e.cur.cx == 6);
  e.home();
  assert(e.cur.cx == 0);
  e.move_left(rows);
  assert(e.cur.cy == 0 && e.cur.cx == 0);
}

static void test_vertical_moves_clamp_column() {
  std::vector<Row> rows{row_of(U"abcdef"), row_of(U"ab"), row_of(U"\tz")};
  CursorEngine e;
  e.set_window(10, 80);
  e.end(rows);
  assert(e.cur.cx == 6);
  e.move_down(rows);
  assert(e.cur.cy == 1 && e.cur.cx == 2);
  e.move_up(rows);
  e.cur.cx = 3;
  e.move_down(rows);
  e.move_down(rows);
  // column 2 falls inside the tab, snaps to its start
  e.cur.cx = 2;
  e.clamp_x(rows);
  assert(e.cur.cy == 2 && e.cur.cx == 0);
  e.move_down(rows);
  assert(e.cur.cy == 2);
  e.move_right(rows);
  e.move_right(rows);
  e.move_right(rows);
  assert(e.cur.cx == 5);
  // end of the last row stays put
  assert(e.cur.cy == 2);
}

static void test_viewport_follows_cursor() {
  std::vector<Row> rows;
  for (int i = 0; i < 30; ++i) rows.push_back(row_of(U"0123456789abcdefghij"));
  CursorEngine e;
  e.set_window(5, 8);
  for (int i = 0; i < 7; ++i) e.move_down(rows);
  assert(e.cur.cy == 7);
  assert(e.vp.row_offset == 3);
  e.end(rows);
  assert(e.cur.cx == 20);
  assert(e.vp.col_offset == 13);
  e.home();
  assert(e.vp.col_offset == 0);
  e.page_down(rows);
  assert(e.cur.cy == 12);
  assert(e.cur.cy >= e.vp.row_offset && e.cur.cy < e.vp.row_offset + e.vp.max_row);
  e.page_up(rows);
  e.page_up(rows);
  e.page_up(rows);
  assert(e.cur.cy == 0 && e.vp.row_offset == 0);
  for (int i = 0; i < 10; ++i) e.page_down(rows);
  assert(e.cur.cy == 29);
}

static void test_search_scrolls_to_match() {
  std::vector<Row> rows;
  for (int i = 0; i < 10; ++i) rows.push_back(row_of(U"filler line"));
  rows[5] = row_of(U"\tneedle here");
  rows[8] = row_of(U"needle again");
  CursorEngine e;
  e.set_window(3, 80);
  std::vector<Key> q = keys(U"needle");
  assert(e.search(rows, q));
  assert(e.cur.cy == 5);
  // render position, past the tab
  assert(e.cur.cx == 4);
  assert(e.vp.row_offset == 3);

  Cursor before = e.cur;
  assert(!e.search(rows, keys(U"absent")));
  assert(e.cur.cy == before.cy && e.cur.cx == before.cx);
}

static void test_search_scrolls_horizontally() {
  std::vector<Row> rows{row_of(U"............................target")};
  CursorEngine e;
  e.set_window(3, 10);
  assert(e.search(rows, keys(U"target")));
  assert(e.cur.cx == 28);
  assert(e.vp.col_offset == 19);
}

static void test_empty_buffer() {
  std::vector<Row> rows;
  CursorEngine e;
  e.set_window(5, 5);
  e.move_down(rows);
  e.move_right(rows);
  e.end(rows);
  e.page_down(rows);
  assert(e.cur.cx == 0 && e.cur.cy == 0);
  assert(e.row_len(rows) == 0);
}

int main() {
  test_horizontal_moves_skip_tabs();
  test_vertical_moves_clamp_column();
  test_viewport_follows_cursor();
  test_search_scrolls_to_match();
  test_search_scrolls_horizontally();
  test_empty_buffer();
  return 0;
}
