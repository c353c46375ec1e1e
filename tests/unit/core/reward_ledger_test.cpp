#include "internal/core/reward_ledger.hpp"

#include <cassert>
#include <iostream>
#include <limits>

#include "support/board_harness.hpp"

namespace {

using bridge::core::RewardLedger;
using bridge::db::model::RequestRecord;
using bridge::testing::Throws;
using bridge::util::ValidationError;

void TestDepositSplitsValueIntoPools() {
  RequestRecord record;
  RewardLedger  rewards(record);
  rewards.Deposit(300, 300, 1000);

  const auto pools = rewards.Pools();
  assert(pools.inclusion == 300);
  assert(pools.tally == 300);
  assert(pools.block == 400);
  assert(record.deposited == 1000);
  assert(rewards.Balanced());
}

void TestDepositBelowEarmarkIsRejectedWithoutEffect() {
  RequestRecord record;
  RewardLedger  rewards(record);
  assert(Throws<ValidationError>([&] { rewards.Deposit(600, 500, 1000); }));
  assert(rewards.Outstanding() == 0);
  assert(record.deposited == 0);
}

void TestDepositOverflowLeavesRecordUntouched() {
  RequestRecord record;
  RewardLedger  rewards(record);
  rewards.Deposit(0, 0, std::numeric_limits<uint64_t>::max() - 1);
  assert(Throws<ValidationError>([&] { rewards.Deposit(0, 0, 10); }, "overflow"));
  assert(record.block_reward == std::numeric_limits<uint64_t>::max() - 1);
  assert(rewards.Balanced());
}

void TestTakesDrainPoolsAndStayBalanced() {
  RequestRecord record;
  RewardLedger  rewards(record);
  rewards.Deposit(300, 300, 1001);

  assert(rewards.TakeBlockHalf() == 200);
  assert(rewards.TakeInclusion() == 300);
  assert(rewards.Balanced());
  assert(rewards.Outstanding() == 300 + 201);

  // Odd block pools leave the extra unit for the second half.
  assert(rewards.TakeBlockRemainder() == 201);
  assert(rewards.TakeTally() == 300);
  assert(rewards.Outstanding() == 0);
  assert(record.paid_out == record.deposited);
  assert(rewards.Balanced());
}

void TestUpgradeAddsOnTop() {
  RequestRecord record;
  RewardLedger  rewards(record);
  rewards.Deposit(300, 300, 1000);
  (void)rewards.TakeInclusion();
  rewards.Deposit(0, 50, 100);

  const auto pools = rewards.Pools();
  assert(pools.inclusion == 0);
  assert(pools.tally == 350);
  assert(pools.block == 450);
  assert(rewards.Balanced());
}

} // namespace

int main() {
  TestDepositSplitsValueIntoPools();
  TestDepositBelowEarmarkIsRejectedWithoutEffect();
  TestDepositOverflowLeavesRecordUntouched();
  TestTakesDrainPoolsAndStayBalanced();
  TestUpgradeAddsOnTop();

  std::cout << "bridge_unit_reward_ledger: pass\n";
  return 0;
}
