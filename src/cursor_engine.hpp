#pragma once
/*
 * CursorEngine
 *
 * Purpose: cursor and viewport movement over a row vector.
 * Invariant: cx always lands on a key boundary of the current row (never
 * inside a tab's span); the viewport scrolls only when the cursor would
 * leave it. cy == rows.size() only happens for an empty buffer.
 */
#include <cstddef>
#include <span>
#include <vector>
#include "key.hpp"
#include "row.hpp"
#include "types.hpp"

class CursorEngine {
public:
  Cursor cur;
  Viewport vp;

  void set_window(size_t text_rows, size_t text_cols);

  void move_left(const std::vector<Row>& rows);
  void move_right(const std::vector<Row>& rows);
  void move_up(const std::vector<Row>& rows);
  void move_down(const std::vector<Row>& rows);
  void home();
  void end(const std::vector<Row>& rows);
  void page_up(const std::vector<Row>& rows);
  void page_down(const std::vector<Row>& rows);
  // After a vertical move: fit cx to the new row and reset col_offset if it fits.
  void clamp_x(const std::vector<Row>& rows);
  // Moves cx left by `width` columns (after a backspace removed that many).
  void step_left(size_t width);
  void scroll_into_view();

  // Sliding-window match over raw keys, first row wins; false if absent.
  bool search(const std::vector<Row>& rows, std::span<const Key> query);

  size_t row_len(const std::vector<Row>& rows) const;
};
