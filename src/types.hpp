#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 * Coordinates: cx/col_offset are rendered columns, cy/row_offset row indices.
 */
#include <cstddef>

enum class Mode { Edit, Search };

struct Cursor { size_t cx = 0; size_t cy = 0; };

struct Viewport {
  size_t row_offset = 0;
  size_t col_offset = 0;
  size_t max_row = 1;  // text rows on screen
  size_t max_col = 1;  // text columns on screen
};
