#pragma once
/*
 * TextBuffer
 *
 * Purpose: the row vector of one editing session plus file load/save.
 * Load: bytes -> Decoder -> KeyParser; CR dropped, LF ends a row.
 * Save: raw form of every row + '\n', written to <path>.tmp, fdatasync,
 * then renamed over the target.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "key_parser.hpp"
#include "row.hpp"

class TextBuffer {
public:
  std::vector<Row> rows;

  explicit TextBuffer(int tab_stop = KEYED_TAB_STOP);

  bool empty() const { return rows.empty(); }
  size_t line_count() const { return rows.size(); }
  int tab_stop() const { return tab_stop_; }
  void set_tab_stop(int width);
  Row make_row() const { return Row(tab_stop_); }

  // Consumes keys until end of input; false with msg on a fatal read error.
  // Undecodable units are skipped and summarized in msg.
  bool load_keys(KeyParser& keys, std::string& msg);
  std::string raw_text() const;

  static TextBuffer from_file(const std::filesystem::path& path, std::string_view encoding, int tab_stop,
                              std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  int tab_stop_;
};
