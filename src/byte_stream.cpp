#include "byte_stream.hpp"
#include <algorithm>
#include <utility>
#include <glog/logging.h>

ByteStream::ByteStream(std::unique_ptr<ByteInput> input, size_t chunk_size)
  : input_(std::move(input)), chunk_size_(std::max<size_t>(1, chunk_size)) {
  VLOG(1) << "byte stream created, chunk size " << chunk_size_;
  buf_.reserve(chunk_size_);
  scratch_.resize(chunk_size_);
}

long ByteStream::fill(size_t want, ReadError& err) {
  // drop consumed prefix before growing
  if (head_ > 0 && head_ == buf_.size()) { buf_.clear(); head_ = 0; }
  else if (head_ >= chunk_size_) { buf_.erase(buf_.begin(), buf_.begin() + static_cast<long>(head_)); head_ = 0; }
  want = std::min(std::max<size_t>(1, want), chunk_size_);
  std::string msg;
  long n = input_->read_some(scratch_.data(), want, msg);
  if (n < 0) {
    LOG(ERROR) << "byte stream fill failed: " << msg;
    err.set(ReadStatus::Io, msg, consumed_);
    return -1;
  }
  buf_.insert(buf_.end(), scratch_.begin(), scratch_.begin() + n);
  VLOG(2) << "byte stream filled " << n << " bytes";
  return n;
}

ReadStatus ByteStream::read_next_byte(uint8_t& out, ReadError& err) {
  if (buffered_count() == 0) {
    long n = fill(chunk_size_, err);
    if (n < 0) return ReadStatus::Io;
    if (n == 0) { VLOG(1) << "input stream closed"; return ReadStatus::Eof; }
  }
  out = buf_[head_++];
  consumed_++;
  return ReadStatus::Ok;
}

ReadStatus ByteStream::peek_ahead(size_t count, std::span<const uint8_t>& out, ReadError& err) {
  size_t safe = std::min(count, chunk_size_);
  while (buffered_count() < safe) {
    long n = fill(safe - buffered_count(), err);
    if (n < 0) return ReadStatus::Io;
    if (n == 0) break;
  }
  size_t avail = std::min(buffered_count(), safe);
  out = std::span<const uint8_t>(buf_.data() + head_, avail);
  return ReadStatus::Ok;
}

WaitResult ByteStream::wait_for_data(int timeout_ms, ReadError& err) {
  if (buffered_count() > 0) return WaitResult::Ready;
  std::string msg;
  WaitResult r = input_->wait_readable(timeout_ms, msg);
  if (r == WaitResult::Error) err.set(ReadStatus::Io, msg, consumed_);
  return r;
}
