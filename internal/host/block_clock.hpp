#pragma once

#include <atomic>
#include <cstdint>

namespace bridge::host {

/*
  Source of host block heights. Claim expiry and reporter activity are
  measured only in these units.
*/
class BlockClock {
 public:
  virtual ~BlockClock() = default;

  virtual uint64_t Current() const = 0;
};

class ManualBlockClock final : public BlockClock {
 public:
  explicit ManualBlockClock(uint64_t start = 0) : height_(start) {
  }

  uint64_t Current() const override {
    return height_.load();
  }

  void Set(uint64_t height) {
    height_.store(height);
  }

  void Advance(uint64_t blocks = 1) {
    height_.fetch_add(blocks);
  }

 private:
  std::atomic<uint64_t> height_;
};

// height = (now - genesis) / interval
class IntervalBlockClock final : public BlockClock {
 public:
  IntervalBlockClock(uint64_t genesis_unix_ms, uint64_t block_interval_ms);

  uint64_t Current() const override;

 private:
  uint64_t genesis_unix_ms_;
  uint64_t block_interval_ms_;
};

} // namespace bridge::host
