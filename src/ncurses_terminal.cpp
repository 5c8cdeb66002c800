#include "ncurses_terminal.hpp"
// built with NCURSES_NOMACROS: clear/refresh/move stay plain names
#include <ncurses.h>

static constexpr short PAIR_TEXT = 1;
static constexpr short PAIR_BAR = 2;

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = true;
    if (use_default_colors() == OK) {
      init_pair(PAIR_TEXT, -1, -1);
      init_pair(PAIR_BAR, COLOR_WHITE, COLOR_RED);
    } else {
      init_pair(PAIR_TEXT, COLOR_WHITE, COLOR_BLACK); // fallback
      init_pair(PAIR_BAR, COLOR_WHITE, COLOR_RED);
    }
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { werase(stdscr); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(PAIR_TEXT));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(PAIR_TEXT));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  int attr = colors_ ? COLOR_PAIR(PAIR_BAR) : A_REVERSE;
  attron(attr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(attr);
}

void NcursesTerminal::move_cursor(int row, int col) { wmove(stdscr, row, col); }

void NcursesTerminal::refresh() { wrefresh(stdscr); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  wmove(stdscr, row, col);
  wclrtoeol(stdscr);
}
