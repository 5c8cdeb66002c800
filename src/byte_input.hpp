#pragma once
/*
 * ByteInput
 *
 * Purpose: abstract sequential byte source under ByteStream (fd, memory,
 * or a channel filled by another thread).
 * Contract: read_some returns >0 bytes, 0 at end of input, <0 on I/O error
 * (msg filled). wait_readable never consumes bytes.
 */
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "posix_fd.hpp"

enum class WaitResult { Ready, Timeout, Error };

class ByteInput {
public:
  virtual ~ByteInput() = default;
  virtual long read_some(uint8_t* dst, size_t cap, std::string& msg) = 0;
  // Ready also covers "end of input is pending", the next read reports it.
  virtual WaitResult wait_readable(int timeout_ms, std::string& msg) = 0;
};

class FdByteInput : public ByteInput {
public:
  // borrows fd, stdin and friends are closed by their owner
  explicit FdByteInput(int fd);
  explicit FdByteInput(UniqueFd owned);
  long read_some(uint8_t* dst, size_t cap, std::string& msg) override;
  WaitResult wait_readable(int timeout_ms, std::string& msg) override;
  int fd() const { return fd_; }
private:
  int fd_;
  UniqueFd owned_;
};

class MemoryByteInput : public ByteInput {
public:
  explicit MemoryByteInput(std::vector<uint8_t> data, size_t max_read = 0);
  explicit MemoryByteInput(std::string_view data, size_t max_read = 0);
  long read_some(uint8_t* dst, size_t cap, std::string& msg) override;
  WaitResult wait_readable(int timeout_ms, std::string& msg) override;
  size_t remaining() const { return data_.size() - pos_; }
private:
  std::vector<uint8_t> data_;
  size_t pos_ = 0;
  size_t max_read_;
};

/*
 * ChannelByteInput: FIFO hand-off between a producer thread and the parser.
 * A timed wait that expires leaves every queued byte in place.
 */
class ChannelByteInput : public ByteInput {
public:
  void push(std::span<const uint8_t> bytes);
  void push(std::string_view bytes);
  void close();
  long read_some(uint8_t* dst, size_t cap, std::string& msg) override;
  WaitResult wait_readable(int timeout_ms, std::string& msg) override;
private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint8_t> bytes_;
  bool closed_ = false;
};
