#include "decoder.hpp"
#include <cctype>
#include <cstdio>
#include <utility>
#include <glog/logging.h>
#include "utf8.hpp"

static constexpr uint8_t ESC_BYTE = 0x1B;

static std::string hex_byte(uint8_t b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(b));
  return buf;
}

static std::string lower_ascii(std::string_view s) {
  std::string out(s);
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

Decoder::Decoder(std::unique_ptr<ByteStream> stream) : stream_(std::move(stream)) {}

bool Decoder::is_next_esc() {
  ReadError err;
  std::span<const uint8_t> ahead;
  if (stream_->peek_ahead(1, ahead, err) != ReadStatus::Ok) return false;
  return !ahead.empty() && ahead[0] == ESC_BYTE;
}

WaitResult Decoder::wait_for_input(int timeout_ms, ReadError& err) {
  return stream_->wait_for_data(timeout_ms, err);
}

ReadStatus Decoder::read_line(std::string& out, ReadError& err) {
  out.clear();
  bool any = false;
  for (;;) {
    char32_t c = 0;
    ReadStatus st = decode_char(c, err);
    if (st == ReadStatus::Eof) return any ? ReadStatus::Ok : ReadStatus::Eof;
    if (st != ReadStatus::Ok) return st;
    any = true;
    if (c == U'\n') return ReadStatus::Ok;
    if (c == U'\r') continue;
    append_utf8(out, c);
  }
}

std::unique_ptr<ByteStream> Decoder::take_stream() {
  return std::move(stream_);
}

ReadStatus Utf8Decoder::decode_char(char32_t& out, ReadError& err) {
  size_t start = stream_->position();
  uint8_t lead = 0;
  ReadStatus st = stream_->read_next_byte(lead, err);
  if (st != ReadStatus::Ok) return st;

  int count = utf8_unit_length(lead);
  if (count == 1) { out = static_cast<char32_t>(lead); return ReadStatus::Ok; }
  if (count == 0) {
    LOG(WARNING) << "utf-8: invalid leading byte " << hex_byte(lead) << " at " << start;
    err.set(ReadStatus::InvalidEncoding, "invalid UTF-8 leading byte " + hex_byte(lead), start, {lead});
    return ReadStatus::InvalidEncoding;
  }

  // strip the length marker, keep the payload bits
  uint32_t cp = lead & (0xFFu >> (count + 1));
  std::vector<uint8_t> collected{lead};
  for (int i = 1; i < count; ++i) {
    uint8_t b = 0;
    st = stream_->read_next_byte(b, err);
    if (st == ReadStatus::Io) return st;
    if (st == ReadStatus::Eof) {
      LOG(WARNING) << "utf-8: input ended at continuation byte " << i << " of " << count;
      err.set(ReadStatus::UnexpectedEof,
              "UTF-8 continuation byte " + std::to_string(i) + " of " + std::to_string(count),
              stream_->position(), collected);
      return ReadStatus::UnexpectedEof;
    }
    collected.push_back(b);
    if (!is_continuation_byte(b)) {
      LOG(WARNING) << "utf-8: bad continuation byte " << hex_byte(b) << " at " << (stream_->position() - 1);
      err.set(ReadStatus::InvalidEncoding,
              "expected continuation byte (10xxxxxx), got " + hex_byte(b),
              stream_->position() - 1, collected);
      return ReadStatus::InvalidEncoding;
    }
    cp = (cp << 6) | (b & 0x3F);
  }

  if (!is_scalar_value(cp)) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "U+%08X", cp);
    LOG(WARNING) << "utf-8: invalid code point " << buf;
    err.set(ReadStatus::InvalidEncoding, std::string("invalid code point ") + buf, start, collected);
    return ReadStatus::InvalidEncoding;
  }
  out = static_cast<char32_t>(cp);
  return ReadStatus::Ok;
}

ReadStatus AsciiDecoder::decode_char(char32_t& out, ReadError& err) {
  size_t pos = stream_->position();
  uint8_t b = 0;
  ReadStatus st = stream_->read_next_byte(b, err);
  if (st != ReadStatus::Ok) return st;
  if (b > 127) {
    LOG(WARNING) << "ascii: byte " << hex_byte(b) << " at " << pos << " is not ASCII";
    err.set(ReadStatus::InvalidEncoding, "byte " + hex_byte(b) + " is not valid ASCII", pos, {b});
    return ReadStatus::InvalidEncoding;
  }
  out = static_cast<char32_t>(b);
  return ReadStatus::Ok;
}

std::vector<std::string_view> supported_encodings() {
  return {"UTF-8", "ASCII"};
}

bool is_supported_encoding(std::string_view encoding) {
  std::string e = lower_ascii(encoding);
  return e == "utf-8" || e == "utf8" || e == "ascii";
}

std::unique_ptr<Decoder> make_decoder(std::string_view encoding, std::unique_ptr<ByteStream> stream, ReadError& err) {
  std::string e = lower_ascii(encoding);
  if (e == "utf-8" || e == "utf8") return std::make_unique<Utf8Decoder>(std::move(stream));
  if (e == "ascii") return std::make_unique<AsciiDecoder>(std::move(stream));
  std::string avail;
  for (auto n : supported_encodings()) { if (!avail.empty()) avail += ", "; avail += n; }
  LOG(WARNING) << "unsupported encoding " << encoding;
  err.set(ReadStatus::UnsupportedEncoding, std::string(encoding) + " (available: " + avail + ")");
  return nullptr;
}

bool switch_encoding(std::unique_ptr<Decoder>& current, std::string_view encoding, ReadError& err) {
  if (!is_supported_encoding(encoding)) {
    make_decoder(encoding, nullptr, err);
    return false;
  }
  std::string want = lower_ascii(encoding);
  if (want == "utf8") want = "utf-8";
  if (!current) { err.set(ReadStatus::Io, "no byte stream to hand over"); return false; }
  if (lower_ascii(current->name()) == want) return true;
  auto next = make_decoder(want, current->take_stream(), err);
  VLOG(1) << "decoder switched from " << current->name() << " to " << next->name()
          << ", " << next->stream().buffered_count() << " bytes carried over";
  current = std::move(next);
  return true;
}
