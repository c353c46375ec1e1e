#include "active_bridge_set.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bridge::abs {

ActiveBridgeSet::ActiveBridgeSet(const host::BlockClock& clock, uint64_t activity_window_blocks)
    : clock_(clock), window_(activity_window_blocks) {
}

bool ActiveBridgeSet::IsActive(uint64_t last_active, uint64_t current) const {
  return current < last_active || current - last_active <= window_;
}

void ActiveBridgeSet::Bootstrap(const std::vector<util::Address>& reporters) {
  for (const auto& reporter : reporters) {
    PushActivity(reporter, 0);
  }
  if (!reporters.empty()) {
    BRIDGE_LOG_INFO("bootstrapped reporters", {observability::UintField("count", reporters.size())});
  }
}

uint64_t ActiveBridgeSet::ActiveCount() {
  const auto      current = clock_.Current();
  std::lock_guard lock(mutex_);
  return static_cast<uint64_t>(std::count_if(last_active_.begin(), last_active_.end(),
                                             [&](const auto& entry) { return IsActive(entry.second, current); }));
}

bool ActiveBridgeSet::IsMember(const util::Address& address) {
  const auto      current = clock_.Current();
  std::lock_guard lock(mutex_);
  auto            it = last_active_.find(address);
  return it != last_active_.end() && IsActive(it->second, current);
}

void ActiveBridgeSet::PushActivity(const util::Address& address, uint64_t block_number) {
  const auto      current = clock_.Current();
  std::lock_guard lock(mutex_);
  auto [it, inserted] = last_active_.try_emplace(address, block_number);
  if (!inserted) {
    it->second = std::max(it->second, block_number);
  }
  if (current != pruned_at_) {
    const auto dropped = PruneLocked(current);
    if (dropped > 0) {
      BRIDGE_LOG_DEBUG("pruned inactive reporters", {observability::UintField("count", dropped),
                                                     observability::UintField("block", current)});
    }
  }
}

std::size_t ActiveBridgeSet::Prune() {
  const auto      current = clock_.Current();
  std::lock_guard lock(mutex_);
  return PruneLocked(current);
}

std::size_t ActiveBridgeSet::PruneLocked(uint64_t current) {
  pruned_at_ = current;
  return std::erase_if(last_active_, [&](const auto& entry) { return !IsActive(entry.second, current); });
}

uint64_t ActiveBridgeSet::LastActive(const util::Address& address) const {
  std::lock_guard lock(mutex_);
  auto            it = last_active_.find(address);
  return it == last_active_.end() ? 0 : it->second;
}

} // namespace bridge::abs
