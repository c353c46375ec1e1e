#include <cassert>
#include <iostream>

#include "internal/abs/active_bridge_set.hpp"
#include "internal/host/block_clock.hpp"
#include "support/board_harness.hpp"

namespace {

using bridge::abs::ActiveBridgeSet;
using bridge::host::ManualBlockClock;
using bridge::testing::Addr;

void TestWindowBoundary() {
  ManualBlockClock clock(10);
  ActiveBridgeSet  set(clock, 100);
  set.PushActivity(Addr(1), 10);

  clock.Set(110);
  assert(set.IsMember(Addr(1)));
  assert(set.ActiveCount() == 1);

  clock.Set(111);
  assert(!set.IsMember(Addr(1)));
  assert(set.ActiveCount() == 0);
}

void TestActivityAheadOfClockCountsAsActive() {
  ManualBlockClock clock(5);
  ActiveBridgeSet  set(clock, 1);
  set.PushActivity(Addr(1), 50);
  assert(set.IsMember(Addr(1)));
}

void TestPushKeepsLatestBlock() {
  ManualBlockClock clock(1);
  ActiveBridgeSet  set(clock, 10);
  set.PushActivity(Addr(1), 30);
  set.PushActivity(Addr(1), 20);
  assert(set.LastActive(Addr(1)) == 30);
  assert(set.LastActive(Addr(2)) == 0);
}

void TestBootstrapAndPrune() {
  ManualBlockClock clock(0);
  ActiveBridgeSet  set(clock, 10);
  set.Bootstrap({Addr(1), Addr(2), Addr(3)});
  set.PushActivity(Addr(3), 15);
  assert(set.ActiveCount() == 3);

  clock.Set(20);
  assert(set.ActiveCount() == 1);
  assert(set.Prune() == 2);
  assert(set.ActiveCount() == 1);
  assert(!set.IsMember(Addr(1)));
  assert(set.IsMember(Addr(3)));
}

void TestActivityDropsStaleIdentities() {
  ManualBlockClock clock(5);
  ActiveBridgeSet  set(clock, 10);
  for (uint8_t i = 1; i <= 8; ++i) {
    set.PushActivity(Addr(i), 5);
  }
  assert(set.LastActive(Addr(1)) == 5);

  clock.Set(50);
  set.PushActivity(Addr(9), 50);
  for (uint8_t i = 1; i <= 8; ++i) {
    assert(set.LastActive(Addr(i)) == 0);
  }
  assert(set.LastActive(Addr(9)) == 50);
  assert(set.ActiveCount() == 1);
  assert(set.Prune() == 0);

  // Activity ahead of the clock survives the sweep.
  set.PushActivity(Addr(10), 80);
  clock.Set(61);
  set.PushActivity(Addr(11), 61);
  assert(set.LastActive(Addr(9)) == 0);
  assert(set.LastActive(Addr(10)) == 80);
  assert(set.ActiveCount() == 2);
}

} // namespace

int main() {
  TestWindowBoundary();
  TestActivityAheadOfClockCountsAsActive();
  TestPushKeepsLatestBlock();
  TestBootstrapAndPrune();
  TestActivityDropsStaleIdentities();

  std::cout << "bridge_unit_active_bridge_set: pass\n";
  return 0;
}
