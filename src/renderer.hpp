#pragma once
/*
 * Renderer
 *
 * Purpose: draw text rows, status bar and message bar for one frame.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from Editor to render.
 * Layout: vp.max_row text rows, then status bar, then message bar.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "message.hpp"
#include "row.hpp"
#include "types.hpp"

struct Frame {
  const std::vector<Row>* rows = nullptr;
  Cursor cur{};
  Viewport vp{};
  Mode mode = Mode::Edit;
  std::string file_name;  // empty for an unnamed buffer
  bool modified = false;
  const Message* message = nullptr;
  // search mode: cursor column on the message bar
  size_t prompt_col = 0;
};

class Renderer {
public:
  void render(ITerminal& term, const Frame& f);

  static std::string status_line(const Frame& f);
  static std::string welcome_text();
};
