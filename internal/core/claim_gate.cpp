#include "claim_gate.hpp"

#include "internal/core/guards.hpp"
#include "internal/core/sortition.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace bridge::core {

using observability::HexField;
using observability::UintField;

ClaimGate::ClaimGate(Ledger& ledger, collab::BlockRelay& relay, collab::ReporterPopulation& population, crypto::VrfVerifier& vrf,
                     crypto::SignatureScheme& signatures, BoardParams params)
    : ledger_(ledger), relay_(relay), population_(population), vrf_(vrf), signatures_(signatures), params_(params) {
}

void ClaimGate::VerifySignature(const host::CallContext& ctx, const ClaimSubmission& submission) {
  const auto digest    = util::Sha256(ctx.caller.data(), ctx.caller.size());
  const auto recovered = signatures_.Recover(util::Bytes(digest.begin(), digest.end()), submission.signature);
  if (!recovered.has_value() || *recovered != util::DeriveAddress(submission.public_key)) {
    throw util::AuthorizationError("signature does not match the public key");
  }
}

void ClaimGate::VerifyVrf(const ClaimSubmission& submission) {
  if (!vrf_.FastVerify(submission.public_key, submission.vrf_proof, relay_.CurrentBeacon(), submission.u_point, submission.v_components)) {
    throw util::AuthorizationError("vrf proof is not valid");
  }
}

bool ClaimGate::Eligible(const util::Bytes& vrf_proof) {
  const auto output = OutputToUint256(vrf_.GammaToHash(vrf_proof));
  return SortitionAccepts(output, population_.ActiveCount(), params_.replication_factor);
}

void ClaimGate::Claim(const host::CallContext& ctx, const ClaimSubmission& submission) {
  if (submission.ids.empty()) {
    throw util::ValidationError("no requests listed");
  }

  VerifySignature(ctx, submission);
  VerifyVrf(submission);
  if (!Eligible(submission.vrf_proof)) {
    throw util::AuthorizationError("not selected by sortition");
  }

  std::vector<db::model::RequestRecord> records;
  records.reserve(submission.ids.size());
  for (const auto id : submission.ids) {
    records.push_back(ledger_.Load(id));
    guards::RequireClaimable(records.back(), ctx.block_number, params_.claim_expiry_blocks);
  }

  for (auto& record : records) {
    record.claimant    = ctx.caller;
    record.claim_block = ctx.block_number;
    ledger_.Store(record);

    db::model::EventRecord event;
    event.kind       = bridge::v1::EVENT_KIND_CLAIMED_REQUEST;
    event.request_id = record.id;
    event.address    = ctx.caller;
    event.block      = ctx.block_number;
    ledger_.Emit(event);
  }

  const auto caller = ctx.caller;
  const auto block  = ctx.block_number;
  ledger_.AfterCommit([this, caller, block] { population_.PushActivity(caller, block); });

  BRIDGE_LOG_INFO("claimed data requests", {UintField("count", submission.ids.size()), HexField("claimant", ctx.caller),
                                            UintField("block", ctx.block_number)});
}

} // namespace bridge::core
