#pragma once
/*
 * ReadError
 *
 * Purpose: status codes and error details shared by byte stream, decoders
 * and key parser.
 * Convention: calls return ReadStatus and fill a ReadError on failure.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class ReadStatus {
  Ok,
  Eof,
  Timeout,
  Io,
  InvalidEncoding,
  UnexpectedEof,
  InvalidSequence,
  UnsupportedEncoding,
};

struct ReadError {
  ReadStatus kind = ReadStatus::Ok;
  std::string message;
  size_t position = 0;
  std::vector<uint8_t> bytes;

  void clear();
  void set(ReadStatus k, std::string msg, size_t pos = 0, std::vector<uint8_t> bs = {});
};

const char* status_name(ReadStatus s);
// Io, UnexpectedEof and UnsupportedEncoding abort the current operation.
bool is_fatal(ReadStatus s);
std::string describe(const ReadError& err);
