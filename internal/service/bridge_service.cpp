#include "bridge_service.hpp"

#include <string>
#include <vector>

#include "internal/core/board.hpp"
#include "internal/host/block_clock.hpp"
#include "internal/payload/ram_payload_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace bridge::service {

using namespace bridge::v1;

namespace {

std::vector<util::Hash256> ToProof(const google::protobuf::RepeatedPtrField<std::string>& proof) {
  std::vector<util::Hash256> out;
  out.reserve(proof.size());
  for (const auto& node : proof) {
    out.push_back(util::ToHash256(node));
  }
  return out;
}

void FillRewards(const core::RewardPools& pools, Rewards* out) {
  out->set_inclusion_reward(pools.inclusion);
  out->set_tally_reward(pools.tally);
  out->set_block_reward(pools.block);
}

} // namespace

BridgeService::BridgeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

host::CallContext BridgeService::ToCallContext(const bridge::v1::CallContext& ctx) const {
  host::CallContext out;
  out.caller       = util::ToAddress(ctx.caller());
  out.value        = ctx.value();
  out.gas_price    = ctx.gas_price();
  out.block_number = ctx_.clock->Current();
  return out;
}

PostRequestResponse BridgeService::PostRequest(const PostRequestRequest& req) {
  return ObserveRpc("BridgeService.PostRequest", 0, [&] {
    const auto call = ToCallContext(req.context());

    PostRequestResponse resp;
    switch (req.source_case()) {
      case PostRequestRequest::kPayloadRef:
        resp.set_id(ctx_.board->PostRequest(call, req.payload_ref(), req.inclusion_reward(), req.tally_reward()));
        break;
      case PostRequestRequest::kPayload: {
        const auto ref = ctx_.payloads->Put(util::ToBytes(req.payload()));
        try {
          resp.set_id(ctx_.board->PostRequest(call, ref, req.inclusion_reward(), req.tally_reward()));
        } catch (const std::exception&) {
          ctx_.payloads->Remove(ref);
          throw;
        }
        break;
      }
      default:
        throw util::ValidationError("post request: payload or payload_ref required");
    }

    return resp;
  });
}

UpgradeRewardResponse BridgeService::UpgradeReward(const UpgradeRewardRequest& req) {
  return ObserveRpc("BridgeService.UpgradeReward", req.id(), [&] {
    const auto pools = ctx_.board->UpgradeReward(ToCallContext(req.context()), req.id(), req.add_inclusion(), req.add_tally());
    UpgradeRewardResponse resp;
    FillRewards(pools, resp.mutable_rewards());
    return resp;
  });
}

CheckClaimabilityResponse BridgeService::CheckClaimability(const CheckClaimabilityRequest& req) {
  return ObserveRpc("BridgeService.CheckClaimability", 0, [&] {
    const std::vector<uint64_t> ids(req.ids().begin(), req.ids().end());
    CheckClaimabilityResponse resp;
    for (bool claimable : ctx_.board->CheckClaimability(ids, ctx_.clock->Current())) {
      resp.add_claimable(claimable);
    }
    return resp;
  });
}

void BridgeService::ClaimRequests(const ClaimRequestsRequest& req) {
  ObserveRpc("BridgeService.ClaimRequests", 0, [&] {
    core::ClaimSubmission submission;
    submission.ids.assign(req.ids().begin(), req.ids().end());
    submission.vrf_proof    = util::ToBytes(req.vrf_proof());
    submission.public_key   = util::ToBytes(req.public_key());
    submission.u_point      = util::ToBytes(req.u_point());
    submission.v_components = util::ToBytes(req.v_components());
    submission.signature    = util::ToBytes(req.signature());

    ctx_.board->ClaimRequests(ToCallContext(req.context()), submission);
  });
}

ReportInclusionResponse BridgeService::ReportInclusion(const ReportInclusionRequest& req) {
  return ObserveRpc("BridgeService.ReportInclusion", req.id(), [&] {
    core::InclusionReport report;
    report.id         = req.id();
    report.proof      = ToProof(req.proof());
    report.index      = req.index();
    report.block_hash = util::ToHash256(req.block_hash());
    report.epoch      = req.epoch();

    ReportInclusionResponse resp;
    resp.set_inclusion_proof_hash(util::ToString(ctx_.board->ReportInclusion(ToCallContext(req.context()), report)));
    return resp;
  });
}

void BridgeService::ReportResult(const ReportResultRequest& req) {
  ObserveRpc("BridgeService.ReportResult", req.id(), [&] {
    core::ResultReport report;
    report.id         = req.id();
    report.proof      = ToProof(req.proof());
    report.index      = req.index();
    report.block_hash = util::ToHash256(req.block_hash());
    report.epoch      = req.epoch();
    report.result     = util::ToBytes(req.result());

    ctx_.board->ReportResult(ToCallContext(req.context()), report);
  });
}

ReadRequestResponse BridgeService::ReadRequest(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.ReadRequest", req.id(), [&] {
    ReadRequestResponse resp;
    *resp.mutable_info() = ctx_.board->ReadRequest(req.id(), ctx_.clock->Current());
    return resp;
  });
}

ReadPayloadResponse BridgeService::ReadPayload(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.ReadPayload", req.id(), [&] {
    ReadPayloadResponse resp;
    resp.set_payload(util::ToString(ctx_.board->ReadPayload(req.id())));
    return resp;
  });
}

ReadResultResponse BridgeService::ReadResult(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.ReadResult", req.id(), [&] {
    ReadResultResponse resp;
    resp.set_result(util::ToString(ctx_.board->ReadResult(req.id())));
    return resp;
  });
}

ReadRewardsResponse BridgeService::ReadRewards(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.ReadRewards", req.id(), [&] {
    ReadRewardsResponse resp;
    FillRewards(ctx_.board->ReadRewards(req.id()), resp.mutable_rewards());
    return resp;
  });
}

ReadProofHashResponse BridgeService::ReadProofHash(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.ReadProofHash", req.id(), [&] {
    ReadProofHashResponse resp;
    resp.set_inclusion_proof_hash(util::ToString(ctx_.board->ReadProofHash(req.id())));
    return resp;
  });
}

IsResolvedResponse BridgeService::IsResolved(const RequestIdRequest& req) {
  return ObserveRpc("BridgeService.IsResolved", req.id(), [&] {
    IsResolvedResponse resp;
    resp.set_resolved(ctx_.board->IsResolved(req.id()));
    return resp;
  });
}

EstimateGasCostResponse BridgeService::EstimateGasCost(const EstimateGasCostRequest& req) {
  return ObserveRpc("BridgeService.EstimateGasCost", 0, [&] {
    const auto minimums = ctx_.board->EstimateGasCost(req.gas_price());
    EstimateGasCostResponse resp;
    resp.set_min_inclusion(minimums.inclusion);
    resp.set_min_tally(minimums.tally);
    resp.set_min_block(minimums.block);
    return resp;
  });
}

ReadBalanceResponse BridgeService::ReadBalance(const ReadBalanceRequest& req) {
  return ObserveRpc("BridgeService.ReadBalance", 0, [&] {
    ReadBalanceResponse resp;
    resp.set_amount(ctx_.board->ReadBalance(util::ToAddress(req.address())));
    return resp;
  });
}

}
