#include <cassert>
#include <iostream>

#include "internal/relay/local_block_relay.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "support/board_harness.hpp"

namespace {

using bridge::relay::LocalBlockRelay;
using bridge::testing::Addr;
using bridge::testing::Hash;
using bridge::testing::Throws;

void TestBeaconBeforeAnyBlock() {
  LocalBlockRelay relay;
  assert(relay.CurrentEpoch() == 0);
  assert(relay.CurrentBeacon() == bridge::util::Bytes(40, 0));
}

void TestBeaconFollowsLatestBlock() {
  LocalBlockRelay relay;
  relay.PostBlock(Addr(9), Hash(0x10), 0x0102, Hash(1), Hash(2));

  const auto beacon = relay.CurrentBeacon();
  assert(beacon.size() == 40);
  assert(std::equal(beacon.begin(), beacon.begin() + 32, Hash(0x10).begin()));
  assert(beacon[38] == 0x01 && beacon[39] == 0x02);
  assert(relay.CurrentEpoch() == 0x0102);
}

void TestPostBlockRejections() {
  LocalBlockRelay relay;
  assert(Throws<bridge::util::ValidationError>([&] { relay.PostBlock(Addr(0), Hash(0x10), 1, Hash(1), Hash(2)); }, "zero"));

  relay.PostBlock(Addr(9), Hash(0x10), 5, Hash(1), Hash(2));
  assert(Throws<bridge::util::StateError>([&] { relay.PostBlock(Addr(9), Hash(0x10), 6, Hash(1), Hash(2)); }, "already posted"));
  assert(Throws<bridge::util::StateError>([&] { relay.PostBlock(Addr(9), Hash(0x11), 5, Hash(1), Hash(2)); }, "increase"));
  assert(relay.CurrentEpoch() == 5);
}

void TestFoldPathOrdersByIndexBits() {
  const auto leaf = Hash(0x01);
  const auto a    = Hash(0x0A);
  const auto b    = Hash(0x0B);

  assert(LocalBlockRelay::FoldPath(leaf, {}, 7) == leaf);
  assert(LocalBlockRelay::FoldPath(leaf, {a, b}, 0) == bridge::util::HashPair(bridge::util::HashPair(leaf, a), b));
  assert(LocalBlockRelay::FoldPath(leaf, {a, b}, 1) == bridge::util::HashPair(bridge::util::HashPair(a, leaf), b));
  assert(LocalBlockRelay::FoldPath(leaf, {a, b}, 2) == bridge::util::HashPair(b, bridge::util::HashPair(leaf, a)));
}

void TestProofsBindBlockAndEpoch() {
  LocalBlockRelay relay;
  const auto      leaf    = Hash(0x01);
  const auto      sibling = Hash(0x02);
  const auto      root    = LocalBlockRelay::FoldPath(leaf, {sibling}, 1);
  relay.PostBlock(Addr(9), Hash(0x10), 3, root, root);

  assert(relay.VerifyInclusionProof({sibling}, Hash(0x10), 3, 1, leaf));
  assert(relay.VerifyResultProof({sibling}, Hash(0x10), 3, 1, leaf));
  assert(!relay.VerifyInclusionProof({sibling}, Hash(0x10), 3, 0, leaf));
  assert(!relay.VerifyInclusionProof({sibling}, Hash(0x10), 4, 1, leaf));
  assert(!relay.VerifyInclusionProof({sibling}, Hash(0x11), 3, 1, leaf));

  assert(relay.RelayerOfRecord(Hash(0x10), 3) == Addr(9));
  assert(bridge::util::IsZero(relay.RelayerOfRecord(Hash(0x10), 2)));
  assert(bridge::util::IsZero(relay.RelayerOfRecord(Hash(0x12), 3)));
}

} // namespace

int main() {
  TestBeaconBeforeAnyBlock();
  TestBeaconFollowsLatestBlock();
  TestPostBlockRejections();
  TestFoldPathOrdersByIndexBits();
  TestProofsBindBlockAndEpoch();

  std::cout << "bridge_unit_local_block_relay: pass\n";
  return 0;
}
