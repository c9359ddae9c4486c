#include "time.hpp"

namespace agentpay::util {

uint64_t ToUnixSeconds(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

uint64_t WallClock::NowSeconds() const {
  return ToUnixSeconds(SystemClock::now());
}

} // namespace agentpay::util
