#include "request_registry.hpp"

#include "internal/core/reward_ledger.hpp"
#include "internal/model/request_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace bridge::core {

using observability::HexField;
using observability::StringField;
using observability::UintField;

RequestRegistry::RequestRegistry(Ledger& ledger, collab::PayloadSource& payloads, collab::BlockRelay& relay, const GasEstimator& estimator,
                                 BoardParams params)
    : ledger_(ledger), payloads_(payloads), relay_(relay), estimator_(estimator), params_(params) {
}

uint64_t RequestRegistry::Create(const host::CallContext& ctx, const std::string& payload_ref, util::Amount inclusion_reward,
                                 util::Amount tally_reward) {
  db::model::RequestRecord record;
  RewardLedger             rewards(record);
  rewards.Deposit(inclusion_reward, tally_reward, ctx.value);
  estimator_.RequireSufficient(rewards.Pools(), ctx.gas_price);

  record.payload_ref   = payload_ref;
  record.payload_hash  = util::Sha256(payloads_.PayloadBytes(payload_ref));
  record.epoch         = relay_.CurrentEpoch();
  record.gas_price     = ctx.gas_price;
  record.requestor     = ctx.caller;
  record.created_block = ctx.block_number;

  const auto id = ledger_.Insert(record);

  db::model::EventRecord event;
  event.kind       = bridge::v1::EVENT_KIND_POSTED_REQUEST;
  event.request_id = id;
  event.address    = ctx.caller;
  event.amount     = ctx.value;
  event.block      = ctx.block_number;
  ledger_.Emit(event);

  BRIDGE_LOG_INFO("posted data request", {UintField("id", id), HexField("requestor", ctx.caller),
                                          UintField("deposit", ctx.value), UintField("epoch", record.epoch)});
  return id;
}

RewardPools RequestRegistry::UpgradeReward(const host::CallContext& ctx, uint64_t id, util::Amount add_inclusion, util::Amount add_tally) {
  auto         record = ledger_.Load(id);
  RewardLedger rewards(record);

  if (ctx.value < util::CheckedAdd(add_inclusion, add_tally)) {
    throw util::ValidationError("insufficient value for reward upgrade");
  }
  if (model::HasResult(record)) {
    throw util::StateError("result already reported");
  }
  const bool included = model::IsIncluded(record);
  if (included && add_inclusion != 0) {
    throw util::ValidationError("inclusion reward already paid");
  }

  rewards.Deposit(add_inclusion, add_tally, ctx.value);
  if (ctx.gas_price > record.gas_price) {
    estimator_.RequireSufficient(rewards.Pools(), ctx.gas_price, included);
    record.gas_price = ctx.gas_price;
  }
  ledger_.Store(record);

  db::model::EventRecord event;
  event.kind       = bridge::v1::EVENT_KIND_UPGRADED_REWARD;
  event.request_id = id;
  event.address    = ctx.caller;
  event.amount     = ctx.value;
  event.block      = ctx.block_number;
  ledger_.Emit(event);

  BRIDGE_LOG_INFO("upgraded reward", {UintField("id", id), UintField("added", ctx.value), UintField("gas_price", record.gas_price)});
  return rewards.Pools();
}

std::vector<bool> RequestRegistry::CheckClaimability(const std::vector<uint64_t>& ids, uint64_t block_number) {
  std::vector<bool> out;
  out.reserve(ids.size());
  for (const auto id : ids) {
    out.push_back(model::IsClaimable(ledger_.Load(id), block_number, params_.claim_expiry_blocks));
  }
  return out;
}

bridge::v1::RequestInfo RequestRegistry::ReadRequest(uint64_t id, uint64_t block_number) {
  const auto record = ledger_.Load(id);

  bridge::v1::RequestInfo info;
  info.set_id(record.id);
  info.set_requestor(util::ToString(record.requestor));
  info.set_claimant(util::ToString(record.claimant));
  info.set_claim_block(record.claim_block);
  info.mutable_rewards()->set_inclusion_reward(record.inclusion_reward);
  info.mutable_rewards()->set_tally_reward(record.tally_reward);
  info.mutable_rewards()->set_block_reward(record.block_reward);
  info.set_gas_price(record.gas_price);
  info.set_epoch(record.epoch);
  info.set_state(model::DeriveState(record, block_number, params_.claim_expiry_blocks));
  info.set_payload_hash(util::ToString(record.payload_hash));
  info.set_inclusion_proof_hash(util::ToString(record.inclusion_proof_hash));
  info.set_has_result(model::HasResult(record));
  info.set_payload_ref(record.payload_ref);
  return info;
}

RewardPools RequestRegistry::ReadRewards(uint64_t id) {
  auto record = ledger_.Load(id);
  return RewardLedger(record).Pools();
}

util::Hash256 RequestRegistry::ReadProofHash(uint64_t id) {
  return ledger_.Load(id).inclusion_proof_hash;
}

util::Bytes RequestRegistry::ReadResult(uint64_t id) {
  return ledger_.Load(id).result;
}

bool RequestRegistry::IsResolved(uint64_t id) {
  return model::HasResult(ledger_.Load(id));
}

util::Bytes RequestRegistry::ReadPayload(uint64_t id) {
  const auto record = ledger_.Load(id);
  auto       bytes  = payloads_.PayloadBytes(record.payload_ref);
  if (util::Sha256(bytes) != record.payload_hash) {
    BRIDGE_LOG_WARN("payload hash mismatch", {UintField("id", id), StringField("payload_ref", record.payload_ref)});
    throw util::ValidationError("payload has been tampered with");
  }
  return bytes;
}

uint64_t RequestRegistry::Count() {
  return ledger_.Count();
}

} // namespace bridge::core
