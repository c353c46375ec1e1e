#pragma once

#include "bridge/v1.hpp"
#include "internal/host/call_context.hpp"
#include "service_context.hpp"

namespace bridge::service {

class BridgeService {
public:
  explicit BridgeService(ServiceContext ctx);

  bridge::v1::PostRequestResponse PostRequest(const bridge::v1::PostRequestRequest& req);
  bridge::v1::UpgradeRewardResponse UpgradeReward(const bridge::v1::UpgradeRewardRequest& req);
  bridge::v1::CheckClaimabilityResponse CheckClaimability(const bridge::v1::CheckClaimabilityRequest& req);
  void ClaimRequests(const bridge::v1::ClaimRequestsRequest& req);
  bridge::v1::ReportInclusionResponse ReportInclusion(const bridge::v1::ReportInclusionRequest& req);
  void ReportResult(const bridge::v1::ReportResultRequest& req);

  bridge::v1::ReadRequestResponse ReadRequest(const bridge::v1::RequestIdRequest& req);
  bridge::v1::ReadPayloadResponse ReadPayload(const bridge::v1::RequestIdRequest& req);
  bridge::v1::ReadResultResponse ReadResult(const bridge::v1::RequestIdRequest& req);
  bridge::v1::ReadRewardsResponse ReadRewards(const bridge::v1::RequestIdRequest& req);
  bridge::v1::ReadProofHashResponse ReadProofHash(const bridge::v1::RequestIdRequest& req);
  bridge::v1::IsResolvedResponse IsResolved(const bridge::v1::RequestIdRequest& req);
  bridge::v1::EstimateGasCostResponse EstimateGasCost(const bridge::v1::EstimateGasCostRequest& req);
  bridge::v1::ReadBalanceResponse ReadBalance(const bridge::v1::ReadBalanceRequest& req);

private:
  // Stamps the current host block onto the transport context.
  host::CallContext ToCallContext(const bridge::v1::CallContext& ctx) const;

  ServiceContext ctx_;
};

}
