#pragma once
/*
 * Row
 *
 * Purpose: one line of text kept twice: the raw Key sequence as typed
 * (lossless, saved to disk) and the rendered text derived from it (tabs
 * expanded, non-printing keys invisible, display only).
 * Invariant: rendered == concat(key_render(k)) over raw; every mutation
 * goes through insert/backspace/split/append and updates both.
 * Positions passed in are rendered columns (one per char32_t).
 */
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "key.hpp"

class Row {
public:
  explicit Row(int tab_stop = KEYED_TAB_STOP);
  Row(std::vector<Key> raw, int tab_stop = KEYED_TAB_STOP);

  const std::vector<Key>& raw() const { return raw_; }
  const std::u32string& rendered() const { return rendered_; }
  int tab_stop() const { return tab_stop_; }
  void set_tab_stop(int tab_stop);

  void render();
  size_t display_len() const { return rendered_.size(); }
  size_t width_of(const Key& k) const { return key_display_width(k, tab_stop_); }

  // First key whose span ends past render_pos; raw().size() at/after the end.
  size_t get_raw_index(size_t render_pos) const;
  // [start, end) of the key at raw_idx in rendered().
  std::pair<size_t, size_t> get_render_index(size_t raw_idx) const;

  // Appends a printing key to the end; false (no change) if it renders empty.
  bool push(const Key& k);
  // false (no change) when the key renders to nothing.
  bool insert(size_t at, const Key& k);
  // Removes the key ending at `at`; returns its rendered width.
  size_t backspace(size_t at);
  // Keys from `at` onward move to the returned row.
  Row split(size_t at);
  void append(const Row& other);

  // Literal text of the line, tabs kept as '\t'.
  std::string raw_text() const;

private:
  std::vector<Key> raw_;
  std::u32string rendered_;
  int tab_stop_;
};

// Index of the first window of hay equal to needle, or npos.
size_t find_key_subsequence(std::span<const Key> hay, std::span<const Key> needle);
