#pragma once
/*
 * UniqueFd
 *
 * Purpose: owns a POSIX descriptor, closes it once.
 * Note: release() hands the descriptor back without closing.
 */
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  // close() result is reported so writers can detect delayed write errors
  bool reset(int fd = -1) {
    bool ok = true;
    if (fd_ >= 0) ok = (::close(fd_) == 0);
    fd_ = fd;
    return ok;
  }

private:
  int fd_ = -1;
};
