#include "text_buffer.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <glog/logging.h>
#include "byte_input.hpp"
#include "byte_stream.hpp"
#include "decoder.hpp"
#include "posix_fd.hpp"

TextBuffer::TextBuffer(int tab_stop) : tab_stop_(std::max(1, tab_stop)) {}

void TextBuffer::set_tab_stop(int width) {
  tab_stop_ = std::max(1, width);
  for (auto& r : rows) r.set_tab_stop(tab_stop_);
}

bool TextBuffer::load_keys(KeyParser& keys, std::string& msg) {
  std::vector<Key> line;
  size_t bad_units = 0;
  std::string first_bad;
  for (;;) {
    Key k;
    ReadError err;
    ReadStatus st = keys.next_key(k, err);
    if (st == ReadStatus::Eof) break;
    if (st == ReadStatus::InvalidSequence) continue;  // its characters follow as literal keys
    if (is_fatal(st)) {
      msg = describe(err);
      return false;
    }
    if (st != ReadStatus::Ok) {
      // undecodable unit is dropped, the rest of the file still loads
      if (bad_units++ == 0) first_bad = describe(err);
      continue;
    }
    if (k.is_control(ControlKind::CR)) continue;
    if (k.is_control(ControlKind::LF)) {
      rows.emplace_back(std::move(line), tab_stop_);
      line.clear();
      continue;
    }
    line.push_back(k);
  }
  // last line without a trailing newline
  if (!line.empty()) rows.emplace_back(std::move(line), tab_stop_);
  if (bad_units > 0) {
    msg = std::to_string(bad_units) + " undecodable unit" + (bad_units == 1 ? "" : "s") + " skipped (" + first_bad + ")";
    LOG(WARNING) << msg;
  }
  return true;
}

std::string TextBuffer::raw_text() const {
  std::string out;
  for (const auto& r : rows) {
    out += r.raw_text();
    out.push_back('\n');
  }
  return out;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string_view encoding, int tab_stop,
                                 std::string& msg, bool& ok) {
  TextBuffer b(tab_stop);
  ok = true;
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) {
    if (errno == ENOENT) { msg = std::string("new file: ") + path.string(); return b; }
    ok = false;
    msg = std::string("can not open file: ") + path.string() + " (" + std::strerror(errno) + ")";
    LOG(ERROR) << msg;
    return b;
  }
  ReadError err;
  auto stream = std::make_unique<ByteStream>(std::make_unique<FdByteInput>(std::move(fd)));
  auto decoder = make_decoder(encoding, std::move(stream), err);
  if (!decoder) {
    ok = false;
    msg = describe(err);
    return b;
  }
  KeyParser keys(std::move(decoder));
  std::string lmsg;
  if (!b.load_keys(keys, lmsg)) {
    ok = false;
    b.rows.clear();
    msg = std::string("can not read file: ") + path.string() + ": " + lmsg;
    LOG(ERROR) << msg;
    return b;
  }
  msg = std::string("opened file: ") + path.string();
  if (!lmsg.empty()) msg += ", " + lmsg;
  LOG(INFO) << msg << ", " << b.rows.size() << " rows, " << keys.encoding();
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    LOG(ERROR) << msg << ": " << std::strerror(errno);
    return false;
  }
  auto fail = [&](const char* what) {
    msg = std::string("write file failed: ") + tmp.string();
    LOG(ERROR) << msg << ": " << what << ": " << std::strerror(errno);
    ufd.reset();
    ::unlink(tmp.string().c_str());
    return false;
  };
  std::string buf;
  buf.reserve(KEYED_WRITE_CHUNK_SIZE);
  auto flush_buf = [&]() -> bool {
    const char* p = buf.data();
    size_t remain = buf.size();
    while (remain > 0) {
      ssize_t w = ::write(ufd.get(), p, remain);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      remain -= static_cast<size_t>(w);
    }
    buf.clear();
    return true;
  };
  size_t bytes = 0;
  for (const auto& r : rows) {
    buf += r.raw_text();
    buf.push_back('\n');
    if (buf.size() >= KEYED_WRITE_CHUNK_SIZE) {
      bytes += buf.size();
      if (!flush_buf()) return fail("write");
    }
  }
  bytes += buf.size();
  if (!flush_buf()) return fail("write");
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail("fsync");
#else
  if (::fdatasync(ufd.get()) != 0) return fail("fdatasync");
#endif
  if (!ufd.reset()) return fail("close");
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    msg = std::string("write file failed: ") + path.string();
    LOG(ERROR) << msg << ": " << ec.message();
    ::unlink(tmp.string().c_str());
    return false;
  }
  msg = std::string("saved file: ") + path.string() + " (" + std::to_string(bytes) + " bytes)";
  LOG(INFO) << msg;
  return true;
}
