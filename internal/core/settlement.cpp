#include "settlement.hpp"

#include "internal/core/guards.hpp"
#include "internal/core/reward_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace bridge::core {

using observability::HexField;
using observability::UintField;

Settlement::Settlement(Ledger& ledger, collab::BlockRelay& relay, collab::ReporterPopulation& population, BoardParams params)
    : ledger_(ledger), relay_(relay), population_(population), params_(params) {
}

util::Hash256 Settlement::ReportInclusion(const host::CallContext& ctx, const InclusionReport& report) {
  auto record = ledger_.Load(report.id);
  guards::RequireNotIncluded(record);
  guards::RequireActiveClaim(record, ctx.block_number, params_.claim_expiry_blocks);
  guards::RequireEpochAfter(record, report.epoch);
  guards::RequireProof(report.proof);

  record.epoch                = report.epoch;
  record.inclusion_proof_hash = util::HashPair(record.payload_hash, report.proof.front());
  ledger_.Store(record);

  if (!relay_.VerifyInclusionProof(report.proof, report.block_hash, report.epoch, report.index, record.payload_hash)) {
    throw util::ProofError("inclusion proof rejected");
  }

  // The relay may have called back into the board.
  record = ledger_.Load(report.id);
  RewardLedger rewards(record);
  const auto   block_share = rewards.TakeBlockHalf();
  const auto   inclusion   = rewards.TakeInclusion();
  ledger_.Store(record);

  db::model::EventRecord event;
  event.kind       = bridge::v1::EVENT_KIND_INCLUDED_REQUEST;
  event.request_id = record.id;
  event.address    = record.claimant;
  event.block      = ctx.block_number;
  ledger_.Emit(event);

  PayBlockShare(record, report.block_hash, report.epoch, block_share, ctx.block_number);
  ledger_.Credit(record.claimant, inclusion, record.id, bridge::v1::PAYOUT_KIND_INCLUSION, ctx.block_number);

  const auto claimant = record.claimant;
  const auto block    = ctx.block_number;
  ledger_.AfterCommit([this, claimant, block] { population_.PushActivity(claimant, block); });

  BRIDGE_LOG_INFO("reported inclusion", {UintField("id", record.id), UintField("epoch", report.epoch),
                                         HexField("block_hash", report.block_hash),
                                         HexField("claimant", record.claimant)});
  return record.inclusion_proof_hash;
}

void Settlement::ReportResult(const host::CallContext& ctx, const ResultReport& report) {
  auto record = ledger_.Load(report.id);
  guards::RequireIncluded(record);
  guards::RequireNoResult(record);
  guards::RequireReporter(population_, ctx.caller);
  guards::RequireEpochNotBefore(record, report.epoch);
  guards::RequireNonEmptyResult(report.result);

  record.epoch  = report.epoch;
  record.result = report.result;
  ledger_.Store(record);

  const auto result_hash = util::HashPair(record.inclusion_proof_hash, record.result);
  if (!relay_.VerifyResultProof(report.proof, report.block_hash, report.epoch, report.index, result_hash)) {
    throw util::ProofError("result proof rejected");
  }

  record = ledger_.Load(report.id);
  RewardLedger rewards(record);
  const auto   block_share = rewards.TakeBlockRemainder();
  const auto   tally       = rewards.TakeTally();
  ledger_.Store(record);

  db::model::EventRecord event;
  event.kind       = bridge::v1::EVENT_KIND_POSTED_RESULT;
  event.request_id = record.id;
  event.address    = ctx.caller;
  event.block      = ctx.block_number;
  ledger_.Emit(event);

  PayBlockShare(record, report.block_hash, report.epoch, block_share, ctx.block_number);
  ledger_.Credit(ctx.caller, tally, record.id, bridge::v1::PAYOUT_KIND_TALLY, ctx.block_number);

  BRIDGE_LOG_INFO("reported result", {UintField("id", record.id), UintField("epoch", report.epoch),
                                      UintField("result_bytes", record.result.size()), HexField("reporter", ctx.caller)});
}

void Settlement::PayBlockShare(const db::model::RequestRecord& record, const util::Hash256& block_hash, uint64_t epoch, util::Amount amount,
                               uint64_t block_number) {
  const auto paid = ledger_.PaidBlock(block_hash);
  if (!paid.has_value()) {
    const auto relayer = relay_.RelayerOfRecord(block_hash, epoch);
    if (util::IsZero(relayer)) {
      ledger_.Credit(record.requestor, amount, record.id, bridge::v1::PAYOUT_KIND_REFUND, block_number);
      return;
    }
    ledger_.MarkPaid({block_hash, record.id, relayer, epoch});
    ledger_.Credit(relayer, amount, record.id, bridge::v1::PAYOUT_KIND_BLOCK, block_number);
    return;
  }

  // The first request paid for this block also gets its second half.
  if (paid->first_request == record.id) {
    ledger_.Credit(paid->relayer, amount, record.id, bridge::v1::PAYOUT_KIND_BLOCK, block_number);
    return;
  }
  ledger_.Credit(record.requestor, amount, record.id, bridge::v1::PAYOUT_KIND_REFUND, block_number);
}

} // namespace bridge::core
