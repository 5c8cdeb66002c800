#pragma once
/*
 * KeyParser
 *
 * Purpose: decoded characters -> semantic Key events, resolving control
 * characters and ANSI CSI (ESC [ ...) / SS3 (ESC O ...) sequences.
 * Escape handling: after ESC, each further character must arrive within the
 * escape timeout; a timeout, a following ESC, an invalid continuation or an
 * over-long buffer flushes the collected characters as literal keys.
 * Restartable: after Eof, a later call resumes once more bytes arrive.
 */
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include "config.hpp"
#include "decoder.hpp"
#include "key.hpp"
#include "read_error.hpp"

class KeyParser {
public:
  enum class Match { Complete, Partial, Invalid };

  explicit KeyParser(std::unique_ptr<Decoder> decoder, int escape_timeout_ms = KEYED_ESCAPE_TIMEOUT_MS);

  // Ok with out set; Eof when no key is available; any error status is
  // reported once and the keys it flushed follow on later calls.
  ReadStatus next_key(Key& out, ReadError& err);

  bool set_encoding(std::string_view encoding, ReadError& err);
  std::string_view encoding() const { return decoder_->name(); }
  void set_escape_timeout(int ms) { escape_timeout_ms_ = ms > 0 ? ms : 1; }
  int escape_timeout() const { return escape_timeout_ms_; }
  size_t pending() const { return pending_.size(); }
  Decoder& decoder() { return *decoder_; }

  // seq starts with ESC; out is set only for Complete.
  static Match match_escape_sequence(std::u32string_view seq, Key& out);

private:
  ReadStatus collect_escape(ReadError& err);
  void flush_literal(const std::u32string& seq);

  std::unique_ptr<Decoder> decoder_;
  int escape_timeout_ms_;
  std::deque<Key> pending_;
};
