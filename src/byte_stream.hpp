#pragma once
/*
 * ByteStream
 *
 * Purpose: buffered reader over a ByteInput with consuming reads and
 * non-consuming look-ahead (used to test "is the next byte ESC").
 * Ownership: owns its input; decoders hand the whole stream to each other
 * when the encoding changes, buffered bytes travel with it.
 */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include "byte_input.hpp"
#include "config.hpp"
#include "read_error.hpp"

class ByteStream {
public:
  explicit ByteStream(std::unique_ptr<ByteInput> input, size_t chunk_size = KEYED_READ_CHUNK_SIZE);

  // Ok with out set, Eof when the input is closed, Io on failure.
  ReadStatus read_next_byte(uint8_t& out, ReadError& err);
  // Up to count bytes without consuming; fewer only at end of input.
  ReadStatus peek_ahead(size_t count, std::span<const uint8_t>& out, ReadError& err);
  // Ready at once if bytes are buffered, otherwise waits on the input.
  WaitResult wait_for_data(int timeout_ms, ReadError& err);

  size_t buffered_count() const { return buf_.size() - head_; }
  // absolute offset of the next byte to be consumed
  size_t position() const { return consumed_; }

private:
  long fill(size_t want, ReadError& err);

  std::unique_ptr<ByteInput> input_;
  size_t chunk_size_;
  std::vector<uint8_t> buf_;
  size_t head_ = 0;
  size_t consumed_ = 0;
  std::vector<uint8_t> scratch_;
};
