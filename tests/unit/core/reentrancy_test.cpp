#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>

#include "support/board_harness.hpp"

namespace {

using bridge::testing::Addr;
using bridge::testing::BoardHarness;
using bridge::testing::DelegatingRelay;
using bridge::testing::Hash;
using bridge::testing::RelayedBlock;
using bridge::testing::Throws;
using bridge::util::StateError;

const auto kRequestor = Addr(0x01);
const auto kReporter  = Addr(0x07);
const auto kRelayer   = Addr(0x09);

// Calls back into the board while it verifies an inclusion or result proof.
class CallbackRelay final : public DelegatingRelay {
 public:
  enum class Mode { Reinclude, ReadHash, Reresult, ReadResult };

  CallbackRelay(std::shared_ptr<bridge::relay::LocalBlockRelay> inner, Mode mode) : DelegatingRelay(std::move(inner)), mode_(mode) {
  }

  bool VerifyInclusionProof(const std::vector<bridge::util::Hash256>& proof, const bridge::util::Hash256& block_hash, uint64_t epoch,
                            uint64_t index, const bridge::util::Hash256& payload_hash) override {
    if (board != nullptr && !pending.proof.empty()) {
      if (mode_ == Mode::Reinclude) {
        nested_rejected = Throws<StateError>([&] { board->ReportInclusion(ctx, pending); }, "already included");
      } else if (mode_ == Mode::ReadHash) {
        observed_hash = board->ReadProofHash(pending.id);
      }
    }
    return inner_->VerifyInclusionProof(proof, block_hash, epoch, index, payload_hash);
  }

  bool VerifyResultProof(const std::vector<bridge::util::Hash256>& proof, const bridge::util::Hash256& block_hash, uint64_t epoch,
                         uint64_t index, const bridge::util::Hash256& result_hash) override {
    if (board != nullptr && !pending_result.proof.empty()) {
      if (mode_ == Mode::Reresult) {
        nested_rejected = Throws<StateError>([&] { board->ReportResult(ctx, pending_result); }, "result already reported");
      } else if (mode_ == Mode::ReadResult) {
        observed_result = board->ReadResult(pending_result.id);
        observed_epoch  = board->ReadRequest(pending_result.id, 0).epoch();
        observed_state  = board->ReadRequest(pending_result.id, 0).state();
      }
    }
    return inner_->VerifyResultProof(proof, block_hash, epoch, index, result_hash);
  }

  bridge::core::BridgeBoard*     board = nullptr;
  bridge::host::CallContext      ctx;
  bridge::core::InclusionReport  pending;
  bridge::core::ResultReport     pending_result;
  bool                           nested_rejected = false;
  bridge::util::Hash256          observed_hash{};
  bridge::util::Bytes            observed_result;
  uint64_t                       observed_epoch = 0;
  bridge::v1::RequestState       observed_state = bridge::v1::REQUEST_STATE_UNSPECIFIED;

 private:
  Mode mode_;
};

struct Rig {
  std::shared_ptr<CallbackRelay> relay;
  std::unique_ptr<BoardHarness>  harness;

  explicit Rig(CallbackRelay::Mode mode) {
    harness = std::make_unique<BoardHarness>(std::make_shared<bridge::db::memory::MemoryRepository>(), bridge::core::BoardParams{},
                                             [this, mode](const std::shared_ptr<bridge::relay::LocalBlockRelay>& inner) {
                                               relay = std::make_shared<CallbackRelay>(inner, mode);
                                               return relay;
                                             });
    relay->board = harness->board.get();
  }
};

void TestFailedNestedCallRollsBackOuterCall() {
  Rig   rig(CallbackRelay::Mode::Reinclude);
  auto& h  = *rig.harness;
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "x", 0x30);

  rig.relay->ctx     = h.Ctx(kReporter);
  rig.relay->pending = BoardHarness::Inclusion(id, block);

  assert(Throws<StateError>([&] { h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block)); },
                            "nested board call failed"));
  assert(rig.relay->nested_rejected);

  const auto info = h.board->ReadRequest(id, h.clock->Current());
  assert(info.state() == bridge::v1::REQUEST_STATE_CLAIMED);
  assert(info.epoch() == 0);
  assert(bridge::util::IsZero(h.board->ReadProofHash(id)));
  assert(h.board->ReadBalance(kReporter) == 0);
  assert(h.board->ReadBalance(kRelayer) == 0);
  assert(h.Outstanding(id) == 10'000'000);

  // Without the callback the same report goes through.
  rig.relay->pending = {};
  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
  assert(h.board->ReadBalance(kReporter) == 3'000'000);
  assert(h.board->ReadBalance(kRelayer) == 2'000'000);
}

void TestNestedReadSeesInFlightWrites() {
  Rig   rig(CallbackRelay::Mode::ReadHash);
  auto& h  = *rig.harness;
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "x", 0x30);

  rig.relay->pending = BoardHarness::Inclusion(id, block);
  const auto hash    = h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));

  assert(!bridge::util::IsZero(hash));
  assert(rig.relay->observed_hash == hash);
  assert(h.board->ReadProofHash(id) == hash);
  assert(h.board->ReadRequest(id, h.clock->Current()).state() == bridge::v1::REQUEST_STATE_INCLUDED);
}

// Posts a later block whose result root commits to `result` for the included request.
RelayedBlock RelayResultBlock(BoardHarness& h, uint64_t id, const RelayedBlock& included, const std::string& result, uint8_t block_tag) {
  const auto result_hash = bridge::util::HashPair(h.board->ReadProofHash(id), bridge::util::ToBytes(result));

  RelayedBlock block;
  block.hash         = Hash(block_tag);
  block.epoch        = h.relay->CurrentEpoch() + 1;
  block.result_proof = included.result_proof;
  h.relay->PostBlock(kRelayer, block.hash, block.epoch, Hash(static_cast<uint8_t>(block_tag ^ 0x11)),
                     bridge::relay::LocalBlockRelay::FoldPath(result_hash, block.result_proof, 0));
  return block;
}

void TestFailedNestedResultRollsBackOuterCall() {
  Rig   rig(CallbackRelay::Mode::Reresult);
  auto& h  = *rig.harness;
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto block = h.RelayBlock(kRelayer, id, "42", 0x30);
  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, block));
  assert(h.board->ReadBalance(kReporter) == 3'000'000);
  assert(h.board->ReadBalance(kRelayer) == 2'000'000);

  rig.relay->ctx            = h.Ctx(kReporter);
  rig.relay->pending_result = BoardHarness::Result(id, block, "42");

  assert(Throws<StateError>([&] { h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "42")); },
                            "nested board call failed"));
  assert(rig.relay->nested_rejected);

  assert(!h.board->IsResolved(id));
  assert(h.board->ReadResult(id).empty());
  assert(h.board->ReadRequest(id, h.clock->Current()).state() == bridge::v1::REQUEST_STATE_INCLUDED);
  assert(h.board->ReadBalance(kReporter) == 3'000'000);
  assert(h.board->ReadBalance(kRelayer) == 2'000'000);
  assert(h.board->ReadBalance(kRequestor) == 0);
  assert(h.Outstanding(id) == 5'000'000);

  rig.relay->pending_result = {};
  h.board->ReportResult(h.Ctx(kReporter), BoardHarness::Result(id, block, "42"));
  assert(h.board->IsResolved(id));
  assert(h.board->ReadBalance(kReporter) == 6'000'000);
  assert(h.board->ReadBalance(kRelayer) == 4'000'000);
  assert(h.Outstanding(id) == 0);
}

void TestNestedReadSeesInFlightResult() {
  Rig   rig(CallbackRelay::Mode::ReadResult);
  auto& h  = *rig.harness;
  const auto id = h.PostDefault(kRequestor);
  h.Claim(0x07, {id});
  const auto included = h.RelayBlock(kRelayer, id, "42", 0x30);
  h.board->ReportInclusion(h.Ctx(kReporter), BoardHarness::Inclusion(id, included));

  const auto later = RelayResultBlock(h, id, included, "42", 0x40);
  assert(later.epoch > included.epoch);

  const auto report         = BoardHarness::Result(id, later, "42");
  rig.relay->pending_result = report;
  h.board->ReportResult(h.Ctx(kReporter), report);

  assert(bridge::util::ToString(rig.relay->observed_result) == "42");
  assert(rig.relay->observed_epoch == later.epoch);
  assert(rig.relay->observed_state == bridge::v1::REQUEST_STATE_RESULTED);
  assert(h.board->ReadRequest(id, h.clock->Current()).epoch() == later.epoch);
  assert(h.board->IsResolved(id));
}

} // namespace

int main() {
  TestFailedNestedCallRollsBackOuterCall();
  TestNestedReadSeesInFlightWrites();
  TestFailedNestedResultRollsBackOuterCall();
  TestNestedReadSeesInFlightResult();

  std::cout << "bridge_unit_reentrancy: pass\n";
  return 0;
}
