#include "key_parser.hpp"
#include <utility>
#include <glog/logging.h>
#include "utf8.hpp"

static constexpr char32_t ESC = 0x1B;

static KeyParser::Match match_csi(std::u32string_view seq, Key& out);
static KeyParser::Match match_ss3(std::u32string_view seq, Key& out);
static KeyParser::Match match_csi_number(std::u32string_view seq, Key& out);

KeyParser::KeyParser(std::unique_ptr<Decoder> decoder, int escape_timeout_ms)
  : decoder_(std::move(decoder)), escape_timeout_ms_(escape_timeout_ms > 0 ? escape_timeout_ms : 1) {}

bool KeyParser::set_encoding(std::string_view encoding, ReadError& err) {
  return switch_encoding(decoder_, encoding, err);
}

ReadStatus KeyParser::next_key(Key& out, ReadError& err) {
  if (pending_.empty()) {
    char32_t c = 0;
    ReadStatus st = decoder_->decode_char(c, err);
    if (st != ReadStatus::Ok) return st;
    if (c != ESC) { out = key_from_char(c); return ReadStatus::Ok; }
    st = collect_escape(err);
    if (st != ReadStatus::Ok) return st;
  }
  if (pending_.empty()) return ReadStatus::Eof;
  out = pending_.front();
  pending_.pop_front();
  return ReadStatus::Ok;
}

void KeyParser::flush_literal(const std::u32string& seq) {
  for (char32_t c : seq) pending_.push_back(key_from_char(c));
}

ReadStatus KeyParser::collect_escape(ReadError& err) {
  std::u32string seq(1, ESC);
  for (;;) {
    ReadError werr;
    WaitResult w = decoder_->wait_for_input(escape_timeout_ms_, werr);
    if (w == WaitResult::Timeout) {
      VLOG(1) << "escape sequence timed out after " << escape_timeout_ms_ << "ms, flushing " << seq.size() << " chars";
      flush_literal(seq);
      return ReadStatus::Ok;
    }
    if (w == WaitResult::Error) {
      flush_literal(seq);
      err = std::move(werr);
      return ReadStatus::Io;
    }

    if (decoder_->is_next_esc()) {
      // the pending candidate is dead; the next ESC opens a fresh cycle
      flush_literal(seq);
      char32_t c = 0;
      ReadStatus st = decoder_->decode_char(c, err);
      if (st != ReadStatus::Ok) return st;
      seq.assign(1, ESC);
      continue;
    }

    char32_t c = 0;
    ReadError derr;
    ReadStatus st = decoder_->decode_char(c, derr);
    if (st == ReadStatus::Eof) { flush_literal(seq); return ReadStatus::Ok; }
    if (st != ReadStatus::Ok) {
      flush_literal(seq);
      err = std::move(derr);
      return st;
    }
    seq.push_back(c);

    Key key;
    Match m = match_escape_sequence(seq, key);
    if (m == Match::Complete) { pending_.push_back(key); return ReadStatus::Ok; }
    if (m == Match::Invalid) {
      std::string text = to_utf8(seq);
      LOG(WARNING) << "invalid escape sequence of " << seq.size() << " chars";
      flush_literal(seq);
      err.set(ReadStatus::InvalidSequence, "unrecognized escape sequence", seq.size(),
              std::vector<uint8_t>(text.begin(), text.end()));
      return ReadStatus::InvalidSequence;
    }
    if (seq.size() >= KEYED_MAX_ESCAPE_LEN) {
      LOG(WARNING) << "escape sequence longer than " << KEYED_MAX_ESCAPE_LEN << " chars, flushing";
      flush_literal(seq);
      return ReadStatus::Ok;
    }
  }
}

KeyParser::Match KeyParser::match_escape_sequence(std::u32string_view seq, Key& out) {
  if (seq.size() < 2) return Match::Partial;
  switch (seq[1]) {
    case U'[': return match_csi(seq, out);
    case U'O': return match_ss3(seq, out);
    default: return Match::Invalid;
  }
}

static KeyParser::Match match_csi(std::u32string_view seq, Key& out) {
  using M = KeyParser::Match;
  if (seq.size() < 3) return M::Partial;
  switch (seq[2]) {
    case U'A': out = Key::arrow(Direction::Up); return M::Complete;
    case U'B': out = Key::arrow(Direction::Down); return M::Complete;
    case U'C': out = Key::arrow(Direction::Right); return M::Complete;
    case U'D': out = Key::arrow(Direction::Left); return M::Complete;
    case U'H': out = Key::control(ControlKind::Home); return M::Complete;
    case U'F': out = Key::control(ControlKind::End); return M::Complete;
    default: break;
  }
  if (seq[2] >= U'0' && seq[2] <= U'9') return match_csi_number(seq, out);
  return M::Invalid;
}

static KeyParser::Match match_ss3(std::u32string_view seq, Key& out) {
  using M = KeyParser::Match;
  if (seq.size() < 3) return M::Partial;
  switch (seq[2]) {
    case U'P': out = Key::function(1); return M::Complete;
    case U'Q': out = Key::function(2); return M::Complete;
    case U'R': out = Key::function(3); return M::Complete;
    case U'S': out = Key::function(4); return M::Complete;
    default: return M::Invalid;
  }
}

// ESC [ <digits> ~ ; 16 and 22 are not assigned
static KeyParser::Match match_csi_number(std::u32string_view seq, Key& out) {
  using M = KeyParser::Match;
  char32_t last = seq.back();
  if (last != U'~') {
    // no assigned code has more than two digits
    if (last >= U'0' && last <= U'9' && seq.size() - 2 <= 2) return M::Partial;
    return M::Invalid;
  }
  std::u32string_view digits = seq.substr(2, seq.size() - 3);
  if (digits.empty() || digits.size() > 2) return M::Invalid;
  int n = 0;
  for (char32_t d : digits) n = n * 10 + static_cast<int>(d - U'0');
  switch (n) {
    case 1: out = Key::control(ControlKind::Home); return M::Complete;
    case 2: out = Key::control(ControlKind::Insert); return M::Complete;
    case 3: out = Key::control(ControlKind::Delete); return M::Complete;
    case 4: out = Key::control(ControlKind::End); return M::Complete;
    case 5: out = Key::control(ControlKind::PageUp); return M::Complete;
    case 6: out = Key::control(ControlKind::PageDown); return M::Complete;
    case 11: case 12: case 13: case 14: case 15:
      out = Key::function(n - 10); return M::Complete;
    case 17: case 18: case 19: case 20: case 21:
      out = Key::function(n - 11); return M::Complete;
    case 23: case 24:
      out = Key::function(n - 12); return M::Complete;
    default: return M::Invalid;
  }
}
