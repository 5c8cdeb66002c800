#include "key_parser.hpp"
#include <unistd.h>
#include <cassert>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "byte_input.hpp"
#include "posix_fd.hpp"

static KeyParser parser_for(std::string_view bytes, size_t max_read = 0) {
  ReadError err;
  auto s = std::make_unique<ByteStream>(std::make_unique<MemoryByteInput>(bytes, max_read));
  return KeyParser(make_decoder("utf-8", std::move(s), err));
}

static std::vector<Key> drain(KeyParser& p) {
  std::vector<Key> out;
  Key k;
  ReadError err;
  while (p.next_key(k, err) == ReadStatus::Ok) out.push_back(k);
  return out;
}

static void test_literal_mapping() {
  assert(key_from_char(0x1B) == Key::control(ControlKind::Escape));
  assert(key_from_char(U'\r') == Key::control(ControlKind::CR));
  assert(key_from_char(U'\n') == Key::control(ControlKind::LF));
  assert(key_from_char(U'\t') == Key::control(ControlKind::Tab));
  assert(key_from_char(0x7F) == Key::control(ControlKind::Delete));
  assert(key_from_char(0x00) == Key::ctrl_of(U'@'));
  assert(key_from_char(0x01) == Key::ctrl_of(U'a'));
  assert(key_from_char(0x11) == Key::ctrl_of(U'q'));
  assert(key_from_char(0x1C) == Key::ctrl_of(U'\\'));
  assert(key_from_char(0x1F) == Key::ctrl_of(U'_'));
  assert(key_from_char(U'中') == Key::character(U'中'));
}

static void test_arrow_in_one_read() {
  auto p = parser_for("\x1b[A");
  Key k;
  ReadError err;
  assert(p.next_key(k, err) == ReadStatus::Ok);
  assert(k == Key::arrow(Direction::Up));
  assert(p.decoder().stream().position() == 3);
  assert(p.next_key(k, err) == ReadStatus::Eof);
}

static void test_sequences_byte_by_byte() {
  auto p = parser_for("\x1b[B\x1b[C\x1b[D\x1b[H\x1b[F\x1bOP\x1bOS\x1b[15~\x1b[3~\x1b[24~\x1b[1~", 1);
  std::vector<Key> want = {
    Key::arrow(Direction::Down), Key::arrow(Direction::Right), Key::arrow(Direction::Left),
    Key::control(ControlKind::Home), Key::control(ControlKind::End),
    Key::function(1), Key::function(4), Key::function(5),
    Key::control(ControlKind::Delete), Key::function(12), Key::control(ControlKind::Home),
  };
  assert(drain(p) == want);
}

static void test_double_escape() {
  auto p = parser_for("\x1b\x1b");
  std::vector<Key> want = {Key::control(ControlKind::Escape), Key::control(ControlKind::Escape)};
  assert(drain(p) == want);
}

static void test_escape_then_sequence() {
  // the second ESC starts a fresh sequence
  auto p = parser_for("\x1b\x1b[A");
  std::vector<Key> want = {Key::control(ControlKind::Escape), Key::arrow(Direction::Up)};
  assert(drain(p) == want);
}

static void test_invalid_sequence_flushes_literals() {
  auto p = parser_for("\x1b[99~x");
  Key k;
  ReadError err;
  assert(p.next_key(k, err) == ReadStatus::InvalidSequence);
  assert(err.kind == ReadStatus::InvalidSequence);
  assert(p.pending() == 5);
  std::vector<Key> want = {
    Key::control(ControlKind::Escape), Key::character(U'['), Key::character(U'9'),
    Key::character(U'9'), Key::character(U'~'), Key::character(U'x'),
  };
  assert(drain(p) == want);
}

static void test_unassigned_codes_rejected() {
  Key k;
  using M = KeyParser::Match;
  assert(KeyParser::match_escape_sequence(U"\x1b[16~", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1b[22~", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1b[1", k) == M::Partial);
  assert(KeyParser::match_escape_sequence(U"\x1b[12", k) == M::Partial);
  assert(KeyParser::match_escape_sequence(U"\x1b[123", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1b[1;", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1b[Z", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1bOX", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1bx", k) == M::Invalid);
  assert(KeyParser::match_escape_sequence(U"\x1b[20~", k) == M::Complete);
  assert(k == Key::function(9));
  assert(KeyParser::match_escape_sequence(U"\x1b[6~", k) == M::Complete);
  assert(k == Key::control(ControlKind::PageDown));
}

static void test_escape_at_end_of_input() {
  auto p = parser_for("a\x1b[");
  std::vector<Key> want = {Key::character(U'a'), Key::control(ControlKind::Escape), Key::character(U'[')};
  assert(drain(p) == want);
}

static void test_decode_error_mid_sequence() {
  auto p = parser_for("\x1b[\xFFq");
  Key k;
  ReadError err;
  assert(p.next_key(k, err) == ReadStatus::InvalidEncoding);
  std::vector<Key> want = {Key::control(ControlKind::Escape), Key::character(U'['), Key::character(U'q')};
  assert(drain(p) == want);
}

static void test_timeout_on_pipe() {
  int fds[2];
  assert(::pipe(fds) == 0);
  UniqueFd w(fds[1]);
  ReadError err;
  auto s = std::make_unique<ByteStream>(std::make_unique<FdByteInput>(UniqueFd(fds[0])));
  KeyParser p(make_decoder("utf-8", std::move(s), err), 10);

  // lone ESC: nothing follows within the timeout
  assert(::write(w.get(), "\x1b", 1) == 1);
  Key k;
  assert(p.next_key(k, err) == ReadStatus::Ok);
  assert(k == Key::control(ControlKind::Escape));

  // the rest arrives late, so it is plain text
  assert(::write(w.get(), "[A", 2) == 2);
  assert(p.next_key(k, err) == ReadStatus::Ok && k == Key::character(U'['));
  assert(p.next_key(k, err) == ReadStatus::Ok && k == Key::character(U'A'));

  // whole sequence at once
  assert(::write(w.get(), "\x1b[A", 3) == 3);
  assert(p.next_key(k, err) == ReadStatus::Ok && k == Key::arrow(Direction::Up));

  w.reset();
  assert(p.next_key(k, err) == ReadStatus::Eof);
}

static void test_channel_producer_thread() {
  auto ch = std::make_unique<ChannelByteInput>();
  ChannelByteInput* raw = ch.get();
  ReadError err;
  KeyParser p(make_decoder("utf-8", std::make_unique<ByteStream>(std::move(ch)), err), 200);
  std::thread producer([raw]{
    raw->push("x");
    raw->push("\x1b");
    raw->push("[");
    raw->push("2");
    raw->push("1~");
    raw->push("\xE4\xB8");
    raw->push("\xAD");
    raw->close();
  });
  std::vector<Key> got = drain(p);
  producer.join();
  std::vector<Key> want = {Key::character(U'x'), Key::function(10), Key::character(U'中')};
  assert(got == want);
}

static void test_switch_encoding_mid_stream() {
  auto ch = std::make_unique<ChannelByteInput>();
  ChannelByteInput* raw = ch.get();
  ReadError err;
  KeyParser p(make_decoder("utf-8", std::make_unique<ByteStream>(std::move(ch)), err));
  raw->push("q");
  Key k;
  assert(p.next_key(k, err) == ReadStatus::Ok && k == Key::character(U'q'));
  assert(p.encoding() == "UTF-8");
  assert(p.set_encoding("ascii", err));
  assert(p.encoding() == "ASCII");
  raw->push("r");
  raw->close();
  assert(p.next_key(k, err) == ReadStatus::Ok && k == Key::character(U'r'));
  assert(p.next_key(k, err) == ReadStatus::Eof);
}

int main() {
  test_literal_mapping();
  test_arrow_in_one_read();
  test_sequences_byte_by_byte();
  test_double_escape();
  test_escape_then_sequence();
  test_invalid_sequence_flushes_literals();
  test_unassigned_codes_rejected();
  test_escape_at_end_of_input();
  test_decode_error_mid_sequence();
  test_timeout_on_pipe();
  test_channel_producer_thread();
  test_switch_encoding_mid_stream();
  return 0;
}
