#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/collab/reporter_population.hpp"
#include "internal/host/block_clock.hpp"

namespace bridge::abs {

/*
  Active bridge set: reporters seen within the last activity_window blocks.

  An identity is active while current_block - last_active_block <= window.
  PushActivity drops inactive identities once per block, so the table holds
  at most the identities seen within the window.
*/
class ActiveBridgeSet final : public collab::ReporterPopulation {
 public:
  ActiveBridgeSet(const host::BlockClock& clock, uint64_t activity_window_blocks);

  // Marks identities active at block 0.
  void Bootstrap(const std::vector<util::Address>& reporters);

  uint64_t ActiveCount() override;
  bool     IsMember(const util::Address& address) override;
  void     PushActivity(const util::Address& address, uint64_t block_number) override;

  std::size_t Prune();

  uint64_t LastActive(const util::Address& address) const;

 private:
  bool        IsActive(uint64_t last_active, uint64_t current) const;
  std::size_t PruneLocked(uint64_t current);

  const host::BlockClock&          clock_;
  uint64_t                         window_;
  mutable std::mutex               mutex_;
  std::map<util::Address, uint64_t> last_active_;
  uint64_t                          pruned_at_ = 0;
};

} // namespace bridge::abs
