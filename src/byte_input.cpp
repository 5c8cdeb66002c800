#include "byte_input.hpp"
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

FdByteInput::FdByteInput(int fd) : fd_(fd) {}

FdByteInput::FdByteInput(UniqueFd owned) : fd_(owned.get()), owned_(std::move(owned)) {}

long FdByteInput::read_some(uint8_t* dst, size_t cap, std::string& msg) {
  for (;;) {
    ssize_t n = ::read(fd_, dst, cap);
    if (n >= 0) return static_cast<long>(n);
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      // non-blocking descriptor: wait for data instead of spinning
      std::string wmsg;
      if (wait_readable(-1, wmsg) == WaitResult::Error) { msg = wmsg; return -1; }
      continue;
    }
    msg = std::string("read failed: ") + std::strerror(errno);
    return -1;
  }
}

WaitResult FdByteInput::wait_readable(int timeout_ms, std::string& msg) {
  struct pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  for (;;) {
    int r = ::poll(&pfd, 1, timeout_ms);
    if (r > 0) return WaitResult::Ready;  // POLLHUP/POLLERR surface on the next read
    if (r == 0) return WaitResult::Timeout;
    if (errno == EINTR) continue;
    msg = std::string("poll failed: ") + std::strerror(errno);
    return WaitResult::Error;
  }
}

MemoryByteInput::MemoryByteInput(std::vector<uint8_t> data, size_t max_read)
  : data_(std::move(data)), max_read_(max_read) {}

MemoryByteInput::MemoryByteInput(std::string_view data, size_t max_read)
  : data_(data.begin(), data.end()), max_read_(max_read) {}

long MemoryByteInput::read_some(uint8_t* dst, size_t cap, std::string&) {
  size_t n = std::min(cap, remaining());
  if (max_read_ > 0) n = std::min(n, max_read_);
  std::memcpy(dst, data_.data() + pos_, n);
  pos_ += n;
  return static_cast<long>(n);
}

WaitResult MemoryByteInput::wait_readable(int, std::string&) {
  return WaitResult::Ready;
}

void ChannelByteInput::push(std::span<const uint8_t> bytes) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
  }
  cv_.notify_all();
}

void ChannelByteInput::push(std::string_view bytes) {
  push(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

void ChannelByteInput::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

long ChannelByteInput::read_some(uint8_t* dst, size_t cap, std::string&) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return !bytes_.empty() || closed_; });
  size_t n = std::min(cap, bytes_.size());
  std::copy_n(bytes_.begin(), n, dst);
  bytes_.erase(bytes_.begin(), bytes_.begin() + static_cast<long>(n));
  return static_cast<long>(n);
}

WaitResult ChannelByteInput::wait_readable(int timeout_ms, std::string&) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto ready = [this]{ return !bytes_.empty() || closed_; };
  if (timeout_ms < 0) { cv_.wait(lock, ready); return WaitResult::Ready; }
  if (cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) return WaitResult::Ready;
  return WaitResult::Timeout;
}
