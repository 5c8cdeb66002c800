#include "editor.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <glog/logging.h>
#include "byte_input.hpp"
#include "byte_stream.hpp"
#include "decoder.hpp"
#include "posix_fd.hpp"
#include "utf8.hpp"

static bool parse_positive(const std::string& s, int& out) {
  if (s.empty() || s.size() > 6) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return false;
  out = std::atoi(s.c_str());
  return out >= 1;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

Editor::Editor(ITerminal& term, KeyParser& keys)
    : term_(term), keys_(keys), buf_(KEYED_TAB_STOP), query_(KEYED_TAB_STOP) {
  register_commands();
  sync_window();
}

std::filesystem::path Editor::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::filesystem::path();
  return std::filesystem::path(home) / KEYED_RC_NAME;
}

void Editor::register_commands() {
  registry_.register_command("set tabstop", [this](const std::vector<std::string>& args, std::string& msg){
    int n = 0;
    if (args.empty() || !parse_positive(args[0], n)) { msg = "set tabstop: use set tabstop <n>, n >= 1"; return false; }
    buf_.set_tab_stop(n);
    query_.set_tab_stop(n);
    engine_.clamp_x(buf_.rows);
    msg = "tabstop=" + std::to_string(n);
    return true;
  });
  registry_.register_command("set encoding", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set encoding: use set encoding utf-8|ascii"; return false; }
    ReadError err;
    if (!keys_.set_encoding(args[0], err)) { msg = describe(err); return false; }
    encoding_ = std::string(keys_.encoding());
    msg = "encoding=" + encoding_;
    return true;
  });
  registry_.register_command("set esctimeout", [this](const std::vector<std::string>& args, std::string& msg){
    int n = 0;
    if (args.empty() || !parse_positive(args[0], n)) { msg = "set esctimeout: use set esctimeout <ms>, ms >= 1"; return false; }
    keys_.set_escape_timeout(n);
    msg = "esctimeout=" + std::to_string(n);
    return true;
  });
}

bool Editor::execute_command(const std::string& line) {
  std::string msg;
  bool ok = registry_.execute_line(line, msg);
  if (!ok) LOG(WARNING) << "command '" << line << "': " << msg;
  set_message(msg);
  return ok;
}

bool Editor::load_rc(const std::filesystem::path& path) {
  if (path.empty()) return true;
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) {
    if (errno == ENOENT) return true;
    set_message(std::string("can not open rc: ") + path.string() + " (" + std::strerror(errno) + ")");
    LOG(ERROR) << message();
    return false;
  }
  ReadError err;
  auto stream = std::make_unique<ByteStream>(std::make_unique<FdByteInput>(std::move(fd)));
  auto decoder = make_decoder(encoding_, std::move(stream), err);
  if (!decoder) { set_message(describe(err)); return false; }
  std::string line;
  size_t lineno = 0;
  bool ok = true;
  for (;;) {
    ReadStatus st = decoder->read_line(line, err);
    if (st == ReadStatus::Eof) break;
    if (st != ReadStatus::Ok) {
      set_message(path.string() + ": " + describe(err));
      LOG(WARNING) << message();
      return false;
    }
    ++lineno;
    std::string s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!execute_command(s)) {
      ok = false;
      set_message(path.string() + ":" + std::to_string(lineno) + ": " + message());
    }
  }
  VLOG(1) << "rc loaded: " << path << " (" << lineno << " lines)";
  return ok;
}

bool Editor::open(const std::filesystem::path& path) {
  std::string msg;
  bool ok = false;
  TextBuffer loaded = TextBuffer::from_file(path, encoding_, buf_.tab_stop(), msg, ok);
  set_message(msg);
  if (!ok) return false;
  buf_ = std::move(loaded);
  file_ = path;
  dirty_ = false;
  engine_.cur = Cursor{};
  engine_.vp.row_offset = 0;
  engine_.vp.col_offset = 0;
  return true;
}

bool Editor::save() {
  if (!file_) { set_message("No file name"); return false; }
  std::string msg;
  bool ok = buf_.write_file(*file_, msg);
  if (ok) dirty_ = false;
  set_message(msg);
  return ok;
}

void Editor::sync_window() {
  TermSize sz = term_.getSize();
  // two bottom lines: status bar and message bar
  int text_rows = std::max(1, sz.rows - 2);
  engine_.set_window(static_cast<size_t>(text_rows), static_cast<size_t>(std::max(1, sz.cols)));
}

void Editor::render() {
  sync_window();
  Frame f;
  f.rows = &buf_.rows;
  f.cur = engine_.cur;
  f.vp = engine_.vp;
  f.mode = mode_;
  if (file_) f.file_name = file_->filename().string();
  f.modified = dirty_;
  f.message = message_ ? &*message_ : nullptr;
  f.prompt_col = std::string(kSearchPrompt).size() + query_.display_len();
  renderer_.render(term_, f);
}

void Editor::run() {
  render();
  for (;;) {
    Key k;
    ReadError err;
    ReadStatus st = keys_.next_key(k, err);
    bool go_on = st == ReadStatus::Ok ? handle_key(k) : handle_read_status(st, err);
    if (!go_on) break;
    render();
  }
}

bool Editor::handle_read_status(ReadStatus st, const ReadError& err) {
  switch (st) {
    case ReadStatus::Ok:
      return true;
    case ReadStatus::Eof:
      LOG(INFO) << "end of input";
      return false;
    default:
      break;
  }
  set_message("Error reading key: " + describe(err));
  if (is_fatal(st)) {
    LOG(ERROR) << "input: " << describe(err);
    return false;
  }
  LOG(WARNING) << "input: " << describe(err);
  return true;
}

bool Editor::handle_key(const Key& k) {
  sync_window();
  if (mode_ == Mode::Search) {
    handle_search_key(k);
    return true;
  }
  if (k.is_ctrl(U'q')) return false;
  handle_edit_key(k);
  return true;
}

void Editor::handle_edit_key(const Key& k) {
  const auto& rows = buf_.rows;
  switch (k.type) {
    case Key::Type::Arrow:
      switch (k.dir) {
        case Direction::Left: engine_.move_left(rows); break;
        case Direction::Right: engine_.move_right(rows); break;
        case Direction::Up: engine_.move_up(rows); break;
        case Direction::Down: engine_.move_down(rows); break;
      }
      return;
    case Key::Type::Function:
      set_message(key_name(k));
      return;
    case Key::Type::Control:
      switch (k.ctrl) {
        case ControlKind::Home: engine_.home(); return;
        case ControlKind::End: engine_.end(rows); return;
        case ControlKind::PageUp: engine_.page_up(rows); return;
        case ControlKind::PageDown: engine_.page_down(rows); return;
        case ControlKind::Backspace: backspace(); return;
        case ControlKind::Delete: delete_forward(); return;
        case ControlKind::CR: split_row(); return;
        case ControlKind::Escape: set_message(key_name(k)); return;
        case ControlKind::Ctrl:
          if (k.ch == U'h') { backspace(); return; }
          if (k.ch == U's') { save(); return; }
          if (k.ch == U'f') { enter_search(); return; }
          break;
        default:
          break;
      }
      break;
    default:
      break;
  }
  insert_key(k);
}

void Editor::insert_key(const Key& k) {
  auto& rows = buf_.rows;
  bool virtual_row = engine_.cur.cy >= rows.size();
  if (virtual_row) rows.push_back(buf_.make_row());
  Row& row = rows[engine_.cur.cy];
  if (!row.insert(engine_.cur.cx, k)) {
    // non-printing key; drop the row it would have created
    if (virtual_row) rows.pop_back();
    return;
  }
  engine_.cur.cx += row.width_of(k);
  engine_.scroll_into_view();
  dirty_ = true;
}

void Editor::split_row() {
  auto& rows = buf_.rows;
  size_t cy = engine_.cur.cy;
  if (cy >= rows.size()) {
    // Enter on the virtual row only ends it
    rows.push_back(buf_.make_row());
  } else {
    Row tail = rows[cy].split(engine_.cur.cx);
    rows.insert(rows.begin() + static_cast<long>(cy) + 1, std::move(tail));
  }
  engine_.cur.cy = cy + 1;
  engine_.cur.cx = 0;
  engine_.vp.col_offset = 0;
  engine_.scroll_into_view();
  dirty_ = true;
}

void Editor::backspace() {
  auto& rows = buf_.rows;
  size_t cy = engine_.cur.cy;
  if (cy >= rows.size()) return;
  if (engine_.cur.cx > 0) {
    size_t w = rows[cy].backspace(engine_.cur.cx);
    engine_.step_left(w);
    dirty_ = true;
    return;
  }
  if (cy == 0) return;
  size_t prev_len = rows[cy - 1].display_len();
  rows[cy - 1].append(rows[cy]);
  rows.erase(rows.begin() + static_cast<long>(cy));
  engine_.cur.cy = cy - 1;
  engine_.cur.cx = prev_len;
  engine_.scroll_into_view();
  dirty_ = true;
}

void Editor::delete_forward() {
  auto& rows = buf_.rows;
  size_t cy = engine_.cur.cy;
  if (cy >= rows.size()) return;
  Row& row = rows[cy];
  if (engine_.cur.cx < row.display_len()) {
    size_t end = row.get_render_index(row.get_raw_index(engine_.cur.cx)).second;
    row.backspace(end);
    dirty_ = true;
    return;
  }
  if (cy + 1 >= rows.size()) return;
  row.append(rows[cy + 1]);
  rows.erase(rows.begin() + static_cast<long>(cy) + 1);
  dirty_ = true;
}

void Editor::enter_search() {
  saved_cur_ = engine_.cur;
  saved_vp_ = engine_.vp;
  query_ = buf_.make_row();
  mode_ = Mode::Search;
  set_message(kSearchPrompt);
}

void Editor::leave_search(bool restore) {
  if (restore) {
    engine_.cur = saved_cur_;
    engine_.vp.row_offset = saved_vp_.row_offset;
    engine_.vp.col_offset = saved_vp_.col_offset;
  }
  mode_ = Mode::Edit;
  message_.reset();
  query_ = buf_.make_row();
}

void Editor::run_search() {
  std::string shown = to_utf8(query_.rendered());
  set_message(kSearchPrompt + shown);
  if (query_.raw().empty() || !engine_.search(buf_.rows, query_.raw())) {
    engine_.cur = saved_cur_;
    engine_.vp.row_offset = saved_vp_.row_offset;
    engine_.vp.col_offset = saved_vp_.col_offset;
    if (!query_.raw().empty()) set_message("Not Found: " + shown);
  }
}

void Editor::handle_search_key(const Key& k) {
  if (k.is_control(ControlKind::Escape)) { leave_search(true); return; }
  if (k.is_control(ControlKind::CR)) { leave_search(false); return; }
  if (k.is_control(ControlKind::Backspace) || k.is_ctrl(U'h')) {
    if (!query_.raw().empty()) query_.backspace(query_.display_len());
  } else if (!query_.push(k)) {
    return;
  }
  run_search();
}
