#include "editor.hpp"
#include <unistd.h>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "byte_input.hpp"
#include "headless_terminal.hpp"

namespace fs = std::filesystem;

static KeyParser parser_for(std::string_view bytes) {
  ReadError err;
  auto s = std::make_unique<ByteStream>(std::make_unique<MemoryByteInput>(bytes));
  return KeyParser(make_decoder("utf-8", std::move(s), err));
}

static fs::path scratch_dir() {
  fs::path d = fs::temp_directory_path() / ("keyed_test_editor_" + std::to_string(::getpid()));
  fs::create_directories(d);
  return d;
}

static std::string read_bytes(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void type(Editor& ed, std::u32string_view text) {
  for (char32_t c : text) assert(ed.handle_key(key_from_char(c)));
}

static void test_typing_into_empty_buffer() {
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  ed.render();
  // welcome banner on an empty unnamed buffer
  assert(term.line(2).find("keyed -- version: ") != std::string::npos);
  assert(term.line(0) == "~");

  // a key that renders nothing does not leave a row behind
  assert(ed.handle_key(Key::control(ControlKind::Insert)));
  assert(ed.rows().empty());
  assert(!ed.dirty());

  type(ed, U"h\ti");
  assert(ed.rows().size() == 1);
  assert(ed.cursor().cx == 6);
  assert(ed.dirty());
  ed.render();
  assert(term.line(0) == "h    i");
  assert(term.line(1) == "~");
  assert(term.reversed(10));
  assert(term.line(10) == "[No Name](modified) Ln 1/1, Col 7");
  assert(term.cursor_row() == 0 && term.cursor_col() == 6);
}

static void test_enter_backspace_delete() {
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  type(ed, U"abcd");
  ed.handle_key(Key::arrow(Direction::Left));
  ed.handle_key(Key::arrow(Direction::Left));
  ed.handle_key(Key::control(ControlKind::CR));
  assert(ed.rows().size() == 2);
  assert(ed.rows()[0].raw_text() == "ab");
  assert(ed.rows()[1].raw_text() == "cd");
  assert(ed.cursor().cy == 1 && ed.cursor().cx == 0);

  // Ctrl-H at column 0 joins with the previous row
  ed.handle_key(Key::ctrl_of(U'h'));
  assert(ed.rows().size() == 1);
  assert(ed.rows()[0].raw_text() == "abcd");
  assert(ed.cursor().cy == 0 && ed.cursor().cx == 2);

  ed.handle_key(Key::control(ControlKind::Backspace));
  assert(ed.rows()[0].raw_text() == "acd");
  assert(ed.cursor().cx == 1);

  ed.handle_key(Key::control(ControlKind::Delete));
  assert(ed.rows()[0].raw_text() == "ad");
  assert(ed.cursor().cx == 1);

  // forward delete at the end of a row pulls up the next row
  ed.handle_key(Key::control(ControlKind::End));
  ed.handle_key(Key::control(ControlKind::CR));
  type(ed, U"xy");
  ed.handle_key(Key::arrow(Direction::Up));
  ed.handle_key(Key::control(ControlKind::End));
  ed.handle_key(Key::control(ControlKind::Delete));
  assert(ed.rows().size() == 1);
  assert(ed.rows()[0].raw_text() == "adxy");

  ed.handle_key(Key::control(ControlKind::Home));
  ed.handle_key(Key::control(ControlKind::Backspace));
  assert(ed.rows()[0].raw_text() == "adxy");

  // Escape and function keys only report
  ed.handle_key(Key::control(ControlKind::Escape));
  assert(ed.message() == "Esc");
  ed.handle_key(Key::function(5));
  assert(ed.message() == "F5");
  assert(ed.rows()[0].raw_text() == "adxy");
  assert(!ed.handle_key(Key::ctrl_of(U'q')));
}

static void test_incremental_search() {
  HeadlessTerminal term(6, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  fs::path dir = scratch_dir();
  fs::path p = dir / "ten.txt";
  {
    std::ofstream out(p, std::ios::binary);
    for (int i = 0; i < 10; ++i) out << (i == 5 ? "the needle is here" : "hay") << "\n";
  }
  assert(ed.open(p));
  assert(ed.rows().size() == 10);

  ed.handle_key(Key::ctrl_of(U'f'));
  assert(ed.mode() == Mode::Search);
  assert(ed.message() == "Search: ");
  type(ed, U"need");
  assert(ed.cursor().cy == 5 && ed.cursor().cx == 4);
  // 4 text rows on a 6-line terminal
  assert(ed.viewport().row_offset == 2);
  ed.render();
  assert(term.line(5) == "Search: need");
  assert(term.cursor_row() == 5 && term.cursor_col() == 12);

  type(ed, U"x");
  assert(ed.message() == "Not Found: needx");
  assert(ed.cursor().cy == 0 && ed.cursor().cx == 0);
  ed.handle_key(Key::control(ControlKind::Backspace));
  assert(ed.cursor().cy == 5);

  ed.handle_key(Key::control(ControlKind::Escape));
  assert(ed.mode() == Mode::Edit);
  assert(ed.cursor().cy == 0 && ed.viewport().row_offset == 0);

  ed.handle_key(Key::ctrl_of(U'f'));
  type(ed, U"is");
  ed.handle_key(Key::control(ControlKind::CR));
  assert(ed.mode() == Mode::Edit);
  assert(ed.cursor().cy == 5 && ed.cursor().cx == 11);
  assert(ed.message().empty());
  assert(!ed.dirty());
  fs::remove_all(dir);
}

static void test_save_and_reload() {
  fs::path dir = scratch_dir();
  fs::path p = dir / "new.txt";
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);

  assert(!ed.save());
  assert(ed.message() == "No file name");

  assert(ed.open(p));
  assert(ed.message().find("new file") != std::string::npos);
  type(ed, U"ab\tc\r中");
  assert(ed.handle_key(Key::ctrl_of(U's')));
  assert(!ed.dirty());
  assert(read_bytes(p) == "ab\tc\n\xE4\xB8\xAD\n");
  ed.render();
  assert(term.line(10) == "new.txt Ln 2/2, Col 2");

  Editor again(term, keys);
  assert(again.open(p));
  assert(again.rows().size() == 2);
  assert(again.rows()[1].raw_text() == "\xE4\xB8\xAD");
  fs::remove_all(dir);
}

static void test_enter_on_empty_buffer() {
  fs::path dir = scratch_dir();
  fs::path p = dir / "blank.txt";
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  assert(ed.open(p));
  assert(ed.handle_key(Key::control(ControlKind::CR)));
  assert(ed.rows().size() == 1);
  assert(ed.rows()[0].raw().empty());
  assert(ed.cursor().cy == 1 && ed.cursor().cx == 0);
  assert(ed.dirty());
  assert(ed.save());
  assert(read_bytes(p) == "\n");

  // typing on the new virtual row appends a second line
  type(ed, U"x");
  assert(ed.rows().size() == 2);
  assert(ed.save());
  assert(read_bytes(p) == "\nx\n");
  fs::remove_all(dir);
}

static void test_read_status_handling() {
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  ReadError err;
  err.set(ReadStatus::InvalidEncoding, "invalid UTF-8 leading byte 0xFF", 3, {0xFF});
  assert(ed.handle_read_status(ReadStatus::InvalidEncoding, err));
  assert(ed.message().rfind("Error reading key: invalid encoding", 0) == 0);

  err.set(ReadStatus::InvalidSequence, "unrecognized escape sequence", 2);
  assert(ed.handle_read_status(ReadStatus::InvalidSequence, err));

  err.set(ReadStatus::UnexpectedEof, "UTF-8 continuation byte 1 of 2", 1, {0xC3});
  assert(!ed.handle_read_status(ReadStatus::UnexpectedEof, err));
  assert(ed.message().find("unexpected end of input") != std::string::npos);

  err.set(ReadStatus::Io, "read failed");
  assert(!ed.handle_read_status(ReadStatus::Io, err));
  ReadError none;
  assert(!ed.handle_read_status(ReadStatus::Eof, none));
}

static void test_rc_file() {
  fs::path dir = scratch_dir();
  fs::path rc = dir / "keyedrc";
  {
    std::ofstream out(rc, std::ios::binary);
    out << "# settings\n"
        << "\" vim style comment\n"
        << "// c style comment\n"
        << "\n"
        << ":set tabstop 8\n"
        << "  set esctimeout=25  \n"
        << "set encoding ascii\n";
  }
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("");
  Editor ed(term, keys);
  assert(ed.load_rc(rc));
  assert(ed.buffer().tab_stop() == 8);
  assert(keys.escape_timeout() == 25);
  assert(keys.encoding() == "ASCII");
  assert(ed.encoding() == "ASCII");

  assert(!ed.execute_command("set tabstop 0"));
  assert(ed.buffer().tab_stop() == 8);
  assert(!ed.execute_command("set encoding ebcdic"));
  assert(keys.encoding() == "ASCII");
  assert(!ed.execute_command("frobnicate"));
  assert(ed.message() == "unknown command: frobnicate");

  {
    std::ofstream out(rc, std::ios::binary | std::ios::trunc);
    out << "set tabstop 2\nset nosuch 1\n";
  }
  assert(!ed.load_rc(rc));
  assert(ed.buffer().tab_stop() == 2);
  assert(ed.load_rc(dir / "absent"));
  fs::remove_all(dir);
}

static void test_run_until_ctrl_q() {
  HeadlessTerminal term(12, 40);
  KeyParser keys = parser_for("x\x1b[Dy\x1b[99~\x11z");
  Editor ed(term, keys);
  ed.run();
  assert(ed.rows().size() == 1);
  // the bad sequence arrives as literal text after the report
  assert(ed.rows()[0].raw_text() == "y[99~x");
  assert(term.refresh_count() > 0);

  // end of input also ends the session
  KeyParser more = parser_for("ab");
  Editor ed2(term, more);
  ed2.run();
  assert(ed2.rows()[0].raw_text() == "ab");
}

static void test_message_expires() {
  HeadlessTerminal term(5, 20);
  std::vector<Row> rows;
  Renderer r;
  Frame f;
  f.rows = &rows;
  f.vp.max_row = 3;
  f.vp.max_col = 20;
  f.file_name = "a.txt";
  Message fresh("hello");
  f.message = &fresh;
  r.render(term, f);
  assert(term.line(4) == "hello");
  assert(term.line(3) == "a.txt Ln 1/0, Col 1");
  Message old("bye", Message::Clock::now() - std::chrono::seconds(KEYED_MESSAGE_TTL_SEC + 1));
  f.message = &old;
  r.render(term, f);
  assert(term.line(4).empty());
  // named buffers get no banner
  assert(term.line(0) == "~");
}

int main() {
  test_typing_into_empty_buffer();
  test_enter_backspace_delete();
  test_incremental_search();
  test_save_and_reload();
  test_enter_on_empty_buffer();
  test_read_status_handling();
  test_rc_file();
  test_run_until_ctrl_q();
  test_message_expires();
  return 0;
}
