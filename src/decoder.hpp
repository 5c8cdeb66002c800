#pragma once
/*
 * Decoder
 *
 * Purpose: turn a ByteStream into Unicode scalar values, one strategy per
 * encoding (UTF-8, ASCII) behind one interface.
 * Ownership: a decoder owns its ByteStream; take_stream() moves it out so a
 * decoder for another encoding can continue on the same buffered bytes.
 */
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "byte_stream.hpp"
#include "read_error.hpp"

class Decoder {
public:
  explicit Decoder(std::unique_ptr<ByteStream> stream);
  virtual ~Decoder() = default;
  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  virtual std::string_view name() const = 0;
  // Ok with out set, Eof on clean end of input, otherwise err is filled.
  virtual ReadStatus decode_char(char32_t& out, ReadError& err) = 0;

  // Peeks one byte; false at end of input or on error.
  bool is_next_esc();
  WaitResult wait_for_input(int timeout_ms, ReadError& err);
  // Characters up to '\n' (dropped), '\r' skipped. Eof only when nothing was read.
  ReadStatus read_line(std::string& out, ReadError& err);

  std::unique_ptr<ByteStream> take_stream();
  ByteStream& stream() { return *stream_; }

protected:
  std::unique_ptr<ByteStream> stream_;
};

class Utf8Decoder : public Decoder {
public:
  using Decoder::Decoder;
  std::string_view name() const override { return "UTF-8"; }
  ReadStatus decode_char(char32_t& out, ReadError& err) override;
};

class AsciiDecoder : public Decoder {
public:
  using Decoder::Decoder;
  std::string_view name() const override { return "ASCII"; }
  ReadStatus decode_char(char32_t& out, ReadError& err) override;
};

std::vector<std::string_view> supported_encodings();
bool is_supported_encoding(std::string_view encoding);
// nullptr with UnsupportedEncoding in err when the name is unknown.
std::unique_ptr<Decoder> make_decoder(std::string_view encoding, std::unique_ptr<ByteStream> stream, ReadError& err);
// Keeps `current` untouched on failure or when the encoding already matches.
bool switch_encoding(std::unique_ptr<Decoder>& current, std::string_view encoding, ReadError& err);
