#include "block_clock.hpp"

#include <chrono>
#include <stdexcept>

namespace bridge::host {

IntervalBlockClock::IntervalBlockClock(uint64_t genesis_unix_ms, uint64_t block_interval_ms)
    : genesis_unix_ms_(genesis_unix_ms), block_interval_ms_(block_interval_ms) {
  if (block_interval_ms_ == 0) {
    throw std::invalid_argument("block interval must be positive");
  }
}

uint64_t IntervalBlockClock::Current() const {
  const auto now_ms =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  if (now_ms <= genesis_unix_ms_) {
    return 0;
  }
  return (now_ms - genesis_unix_ms_) / block_interval_ms_;
}

} // namespace bridge::host
