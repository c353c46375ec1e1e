#include "reward_ledger.hpp"

#include "internal/util/errors.hpp"

namespace bridge::core {

RewardPools RewardLedger::Pools() const {
  return {record_.inclusion_reward, record_.tally_reward, record_.block_reward};
}

void RewardLedger::Deposit(util::Amount add_inclusion, util::Amount add_tally, util::Amount value) {
  const auto earmarked = util::CheckedAdd(add_inclusion, add_tally);
  if (value < earmarked) {
    throw util::ValidationError("insufficient value for rewards");
  }

  // Compute everything first so an overflow leaves the record untouched.
  const auto inclusion = util::CheckedAdd(record_.inclusion_reward, add_inclusion);
  const auto tally     = util::CheckedAdd(record_.tally_reward, add_tally);
  const auto block     = util::CheckedAdd(record_.block_reward, value - earmarked);
  const auto deposited = util::CheckedAdd(record_.deposited, value);

  record_.inclusion_reward = inclusion;
  record_.tally_reward     = tally;
  record_.block_reward     = block;
  record_.deposited        = deposited;
}

util::Amount RewardLedger::Take(util::Amount& pool, util::Amount amount) {
  pool             = util::CheckedSub(pool, amount);
  record_.paid_out = util::CheckedAdd(record_.paid_out, amount);
  return amount;
}

util::Amount RewardLedger::TakeInclusion() {
  return Take(record_.inclusion_reward, record_.inclusion_reward);
}

util::Amount RewardLedger::TakeTally() {
  return Take(record_.tally_reward, record_.tally_reward);
}

util::Amount RewardLedger::TakeBlockHalf() {
  return Take(record_.block_reward, record_.block_reward / 2);
}

util::Amount RewardLedger::TakeBlockRemainder() {
  return Take(record_.block_reward, record_.block_reward);
}

util::Amount RewardLedger::Outstanding() const {
  return record_.inclusion_reward + record_.tally_reward + record_.block_reward;
}

bool RewardLedger::Balanced() const {
  return Outstanding() + record_.paid_out == record_.deposited;
}

} // namespace bridge::core
