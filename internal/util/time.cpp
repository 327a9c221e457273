#include "time.hpp"

#include <atomic>

namespace songqueue::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  static std::atomic<uint64_t> last{0};

  // system_clock may step backwards; request timestamps must not, and two
  // submissions never share a millisecond.
  uint64_t now  = ToUnixMillis(Now());
  uint64_t prev = last.load();
  while (true) {
    const uint64_t next = now > prev ? now : prev + 1;
    if (last.compare_exchange_weak(prev, next)) {
      return next;
    }
  }
}

} // namespace songqueue::util
