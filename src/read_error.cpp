#include "read_error.hpp"
#include <cstdio>
#include <utility>

void ReadError::clear() {
  kind = ReadStatus::Ok;
  message.clear();
  position = 0;
  bytes.clear();
}

void ReadError::set(ReadStatus k, std::string msg, size_t pos, std::vector<uint8_t> bs) {
  kind = k;
  message = std::move(msg);
  position = pos;
  bytes = std::move(bs);
}

const char* status_name(ReadStatus s) {
  switch (s) {
    case ReadStatus::Ok: return "ok";
    case ReadStatus::Eof: return "end of input";
    case ReadStatus::Timeout: return "timeout";
    case ReadStatus::Io: return "I/O error";
    case ReadStatus::InvalidEncoding: return "invalid encoding";
    case ReadStatus::UnexpectedEof: return "unexpected end of input";
    case ReadStatus::InvalidSequence: return "invalid sequence";
    case ReadStatus::UnsupportedEncoding: return "unsupported encoding";
  }
  return "unknown";
}

bool is_fatal(ReadStatus s) {
  return s == ReadStatus::Io || s == ReadStatus::UnexpectedEof || s == ReadStatus::UnsupportedEncoding;
}

std::string describe(const ReadError& err) {
  std::string out = status_name(err.kind);
  if (!err.message.empty()) { out += ": "; out += err.message; }
  if (!err.bytes.empty()) {
    out += " [";
    char hex[8];
    for (size_t i = 0; i < err.bytes.size(); ++i) {
      std::snprintf(hex, sizeof(hex), i ? " %02X" : "%02X", static_cast<unsigned>(err.bytes[i]));
      out += hex;
    }
    out += "]";
  }
  return out;
}
