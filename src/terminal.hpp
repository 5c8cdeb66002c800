#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around the ncurses session (raw mode, no echo,
 * alternate screen). Construct once per editing session; the destructor
 * restores the terminal on every exit path, including exceptions.
 */

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
