#pragma once
/*
 * Editor
 *
 * Purpose: one editing session; routes keys from KeyParser to the row
 * vector and CursorEngine, and drives Renderer after every key.
 * Modes: Edit (default) and Search (Ctrl-F, incremental, prompt on the
 * message bar).
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "cursor_engine.hpp"
#include "iterminal.hpp"
#include "key_parser.hpp"
#include "message.hpp"
#include "renderer.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(ITerminal& term, KeyParser& keys);

  // Loads `path` into the buffer; a missing file starts an empty named buffer.
  bool open(const std::filesystem::path& path);
  // Executes every command line of an rc file; a missing file is not an error.
  bool load_rc(const std::filesystem::path& path);
  bool execute_command(const std::string& line);
  bool save();

  void run();
  // false when the session should end
  bool handle_key(const Key& k);
  bool handle_read_status(ReadStatus st, const ReadError& err);
  void render();

  const std::vector<Row>& rows() const { return buf_.rows; }
  const TextBuffer& buffer() const { return buf_; }
  Cursor cursor() const { return engine_.cur; }
  const Viewport& viewport() const { return engine_.vp; }
  Mode mode() const { return mode_; }
  bool dirty() const { return dirty_; }
  std::string message() const { return message_ ? message_->text : std::string(); }
  const std::string& encoding() const { return encoding_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_; }

  static std::filesystem::path default_rc_path();
  static constexpr const char* kSearchPrompt = "Search: ";

private:
  void register_commands();
  void sync_window();
  void set_message(std::string text) { message_ = Message(std::move(text)); }

  void handle_edit_key(const Key& k);
  void handle_search_key(const Key& k);
  void enter_search();
  void leave_search(bool restore);
  void run_search();

  void insert_key(const Key& k);
  void split_row();
  void backspace();
  void delete_forward();

  ITerminal& term_;
  KeyParser& keys_;
  Renderer renderer_;
  CommandRegistry registry_;
  TextBuffer buf_;
  CursorEngine engine_;
  Mode mode_ = Mode::Edit;
  bool dirty_ = false;
  std::optional<Message> message_;
  std::optional<std::filesystem::path> file_;
  std::string encoding_ = KEYED_DEFAULT_ENCODING;

  // search mode
  Row query_;
  Cursor saved_cur_{};
  Viewport saved_vp_{};
};
