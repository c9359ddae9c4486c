#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace agentpay::util {

/*
  Time utilities: single place to control clock source.

  Ledger timestamps (validUntil, authorization windows) are unix seconds.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

uint64_t ToUnixSeconds(TimePoint tp);
uint64_t ToUnixMillis(TimePoint tp);

class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t NowSeconds() const = 0;
};

class WallClock final : public Clock {
 public:
  uint64_t NowSeconds() const override;
};

// Deterministic clock for tests and replay tooling.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t now_seconds = 0) : now_(now_seconds) {
  }

  uint64_t NowSeconds() const override {
    return now_.load();
  }

  void Set(uint64_t now_seconds) {
    now_.store(now_seconds);
  }

  void Advance(uint64_t seconds) {
    now_.fetch_add(seconds);
  }

 private:
  std::atomic<uint64_t> now_;
};

} // namespace agentpay::util
