#include "terminal.hpp"
#include <locale.h>
#include <ncurses.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  // stdin belongs to KeyParser; never let refresh poll it
  typeahead(-1);
  raw();
  noecho();
  nonl();
  // escape sequences are decoded by KeyParser from the raw bytes
  keypad(stdscr, FALSE);
}

Terminal::~Terminal() {
  endwin();
}
