#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "support/board_harness.hpp"

namespace {

using bridge::testing::Addr;
using bridge::testing::BoardHarness;
using bridge::testing::DelegatingRelay;
using bridge::testing::Hash;
using bridge::testing::Throws;
using bridge::util::AuthorizationError;
using bridge::util::ProofError;
using bridge::util::StateError;
using bridge::util::ValidationError;

const auto kRequestor = Addr(0x01);
const auto kReporter  = Addr(0x07);
const auto kRelayer   = Addr(0x09);

std::map<bridge::v1::PayoutKind, uint64_t> PayoutTotals(BoardHarness& h) {
  std::map<bridge::v1::PayoutKind, uint64_t> totals;
  for (const auto& event : h.board->ReadEvents(0, std::nullopt)) {
    if (event.kind == bridge::v1::EVENT_KIND_PAYOUT) totals[event.payout] += event.amount;
  }
  return totals;
}

void TestFullLifecyclePaysEveryPool() {
  BoardHarness h;
  const auto   id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kReporter, id, "1850.25", 0x30);

  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
  assert(h.board->ReadBalance(kReporter) == 3'000'000 + 2'000'000);
  auto pools = h.board->ReadRewards(id);
  assert(pools.inclusion == 0);
  assert(pools.tally == 3'000'000);
  assert(pools.block == 2'000'000);

  const auto info = h.board->ReadRequest(id, h.clock->Current());
  assert(info.state() == bridge::v1::REQUEST_STATE_INCLUDED);
  assert(info.epoch() == block.epoch);

  h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "1850.25"));
  assert(h.board->ReadBalance(kReporter) == 10'000'000);
  assert(h.Outstanding(id) == 0);

  const auto totals = PayoutTotals(h);
  assert(totals.at(bridge::v1::PAYOUT_KIND_INCLUSION) == 3'000'000);
  assert(totals.at(bridge::v1::PAYOUT_KIND_TALLY) == 3'000'000);
  assert(totals.at(bridge::v1::PAYOUT_KIND_BLOCK) == 4'000'000);
  assert(!totals.contains(bridge::v1::PAYOUT_KIND_REFUND));
}

void TestSecondInclusionAlwaysFails() {
  BoardHarness h;
  const auto   id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kReporter, id, "x", 0x30);
  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));

  auto report = BoardHarness::Inclusion(id, block);
  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), report); }, "already included"));

  report.proof = {Hash(0xEE)};
  report.epoch = 99;
  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), report); }, "already included"));
  assert(h.board->ReadBalance(kReporter) == 5'000'000);
}

void TestInclusionRequiresActiveClaim() {
  BoardHarness h;
  const auto   id    = h.PostDefault(kRequestor);
  const auto   block = h.RelayBlock(kRelayer, id, "x", 0x30);
  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block)); },
                            "has not yet been claimed"));

  h.Claim(0x07, {id});
  h.clock->Advance(h.params.claim_expiry_blocks + 1);
  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block)); },
                            "has not yet been claimed"));
}

void TestInclusionEpochMustAdvance() {
  BoardHarness h;
  h.relay->PostBlock(kRelayer, Hash(0x60), 4, Hash(0x61), Hash(0x62));
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});

  auto report  = BoardHarness::Inclusion(id, h.RelayBlock(kRelayer, id, "x", 0x30));
  report.epoch = 4;
  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), report); }, "epoch"));
}

void TestRejectedInclusionProofRollsBackEverything() {
  BoardHarness h;
  const auto   id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block         = h.RelayBlock(kRelayer, id, "x", 0x30);
  const auto events_before = h.board->ReadEvents(0, std::nullopt).size();

  auto report  = BoardHarness::Inclusion(id, block);
  report.proof = {Hash(0xEE)};
  assert(Throws<ProofError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), report); }));

  const auto info = h.board->ReadRequest(id, h.clock->Current());
  assert(info.epoch() == 0);
  assert(info.state() == bridge::v1::REQUEST_STATE_CLAIMED);
  assert(bridge::util::IsZero(h.board->ReadProofHash(id)));
  assert(h.board->ReadBalance(kRelayer) == 0);
  assert(h.board->ReadBalance(kReporter) == 0);
  assert(h.Outstanding(id) == 10'000'000);
  assert(h.board->ReadEvents(0, std::nullopt).size() == events_before);

  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
}

void TestResultGuards() {
  BoardHarness h;
  const auto   id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "x", 0x30);

  assert(Throws<StateError>([&] { h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "x")); }, "not yet included"));

  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));

  assert(Throws<AuthorizationError>([&] { h.board->ReportResult(h.Ctx(Addr(0x55)), BoardHarness::Result(id, block, "x")); },
                                    "not an active reporter"));
  assert(Throws<ValidationError>([&] { h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "")); }, "empty"));

  auto early  = BoardHarness::Result(id, block, "x");
  early.epoch = block.epoch - 1;
  assert(Throws<StateError>([&] { h.board->ReportResult(h.Ctx(kReporter), early); }, "predates"));

  assert(Throws<ProofError>([&] { h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "y")); }));
  assert(!h.board->IsResolved(id));
  assert(h.board->ReadRewards(id).tally == 3'000'000);

  h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "x"));
  assert(Throws<StateError>([&] { h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "x")); }, "result already reported"));
}

void TestResultReporterNeedNotBeClaimant() {
  BoardHarness h;
  h.population->Bootstrap({Addr(0x0B)});
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "x", 0x30);
  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
  h.board->ReportResult(h.Ctx(Addr(0x0B)), BoardHarness::Result(id, block, "x"));

  assert(h.board->ReadBalance(kReporter) == 3'000'000);
  assert(h.board->ReadBalance(Addr(0x0B)) == 3'000'000);
  assert(h.board->ReadBalance(kRelayer) == 4'000'000);
}

// Two requests proven by the same block: leaves at index 0 and 1.
void TestSharedBlockPaysOneRelayerAndRefundsTheRest() {
  BoardHarness h;
  const auto   first  = h.PostDefault(kRequestor, "GET /a");
  const auto   second = h.PostDefault(kRequestor, "GET /b");
  h.Claim(0x07, {first, second});

  const auto leaf_a = h.PayloadHash(first);
  const auto leaf_b = h.PayloadHash(second);
  const auto iph_a  = bridge::util::HashPair(leaf_a, leaf_b);
  const auto iph_b  = bridge::util::HashPair(leaf_b, leaf_a);
  const auto res_a  = bridge::util::HashPair(iph_a, bridge::util::ToBytes("a"));
  const auto res_b  = bridge::util::HashPair(iph_b, bridge::util::ToBytes("b"));

  bridge::testing::RelayedBlock block;
  block.hash  = Hash(0x70);
  block.epoch = 1;
  h.relay->PostBlock(kRelayer, block.hash, block.epoch, bridge::util::HashPair(leaf_a, leaf_b), bridge::util::HashPair(res_a, res_b));

  auto include_a  = BoardHarness::Inclusion(first, block);
  include_a.proof = {leaf_b};
  auto include_b  = BoardHarness::Inclusion(second, block);
  include_b.proof = {leaf_a};
  include_b.index = 1;

  assert(h.board->ReportInclusion(h.Ctx(kReporter), include_a) == iph_a);
  assert(h.board->ReportInclusion(h.Ctx(kReporter), include_b) == iph_b);
  assert(h.board->ReadBalance(kRelayer) == 2'000'000);
  assert(h.board->ReadBalance(kRequestor) == 2'000'000);

  auto result_a  = BoardHarness::Result(first, block, "a");
  result_a.proof = {res_b};
  auto result_b  = BoardHarness::Result(second, block, "b");
  result_b.proof = {res_a};
  result_b.index = 1;

  h.board->ReportResult(h.Ctx(kReporter), result_b);
  h.board->ReportResult(h.Ctx(kReporter), result_a);

  // The relayer keeps both halves of the first request only.
  assert(h.board->ReadBalance(kRelayer) == 4'000'000);
  assert(h.board->ReadBalance(kRequestor) == 4'000'000);
  assert(h.board->ReadBalance(kReporter) == 12'000'000);
  assert(h.Outstanding(first) == 0 && h.Outstanding(second) == 0);
  assert(PayoutTotals(h).at(bridge::v1::PAYOUT_KIND_REFUND) == 4'000'000);
}

class AnonymousRelay final : public DelegatingRelay {
 public:
  using DelegatingRelay::DelegatingRelay;

  bridge::util::Address RelayerOfRecord(const bridge::util::Hash256&, uint64_t) override {
    return {};
  }
};

void TestUnknownRelayerRefundsRequestor() {
  BoardHarness h(std::make_shared<bridge::db::memory::MemoryRepository>(), {},
                 [](const auto& inner) { return std::make_shared<AnonymousRelay>(inner); });
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "x", 0x30);

  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
  h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "x"));

  assert(h.board->ReadBalance(kRelayer) == 0);
  assert(h.board->ReadBalance(kRequestor) == 4'000'000);
  assert(h.board->ReadBalance(kReporter) == 6'000'000);
}

void TestLedgerStaysBalancedAcrossRequests() {
  BoardHarness h;
  uint64_t     deposited = 0;
  for (int i = 0; i < 3; ++i) {
    h.Post(kRequestor, 10'000'000 + static_cast<uint64_t>(i), 3'000'000, 3'000'000, "GET /" + std::to_string(i));
    deposited += 10'000'000 + static_cast<uint64_t>(i);
  }
  h.Claim(0x07, {1, 2, 3});
  for (uint64_t id = 1; id <= 3; ++id) {
    const auto block = h.RelayBlock(kRelayer, id, "r", static_cast<uint8_t>(0x30 + id));
    h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
    if (id != 2) h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "r"));
  }

  uint64_t total = h.board->ReadBalance(kRequestor) + h.board->ReadBalance(kReporter) + h.board->ReadBalance(kRelayer);
  for (uint64_t id = 1; id <= 3; ++id) total += h.Outstanding(id);
  assert(total == deposited);

  // Every credited address, not just the three known ones.
  auto     tx       = h.repository->Begin();
  uint64_t balances = 0;
  for (const auto& balance : h.repository->ListBalances(*tx)) balances += balance.amount;
  tx->Rollback();

  const auto stats = h.board->Stats(h.clock->Current());
  assert(stats.deposited_total() == deposited);
  assert(stats.balances_total() == balances);
  assert(stats.escrowed_total() + stats.balances_total() == stats.deposited_total());
  assert(stats.escrowed_total() == h.Outstanding(2));
}

} // namespace

int main() {
  TestFullLifecyclePaysEveryPool();
  TestSecondInclusionAlwaysFails();
  TestInclusionRequiresActiveClaim();
  TestInclusionEpochMustAdvance();
  TestRejectedInclusionProofRollsBackEverything();
  TestResultGuards();
  TestResultReporterNeedNotBeClaimant();
  TestSharedBlockPaysOneRelayerAndRefundsTheRest();
  TestUnknownRelayerRefundsRequestor();
  TestLedgerStaysBalancedAcrossRequests();

  std::cout << "bridge_unit_settlement: pass\n";
  return 0;
}
