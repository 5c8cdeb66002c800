#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; keeps a character grid, the
 * reversed-video rows and the last cursor position.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  // row content as UTF-8, trailing blanks stripped
  std::string line(int row) const;
  bool reversed(int row) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text);

  int rows_;
  int cols_;
  std::vector<std::u32string> grid_;
  std::vector<bool> reversed_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
};
