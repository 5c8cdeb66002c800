#pragma once
/*
 * Message
 *
 * Purpose: transient status text; shown until KEYED_MESSAGE_TTL_SEC passes.
 * Note: expiry is checked on redraw, which only happens after a key.
 */
#include <chrono>
#include <string>
#include <utility>
#include "config.hpp"

struct Message {
  using Clock = std::chrono::steady_clock;
  std::string text;
  Clock::time_point time;

  Message() : time(Clock::now()) {}
  explicit Message(std::string t, Clock::time_point at = Clock::now()) : text(std::move(t)), time(at) {}

  bool expired(Clock::time_point now = Clock::now()) const {
    return now - time >= std::chrono::seconds(KEYED_MESSAGE_TTL_SEC);
  }
};
