#include "client/cpp/bridge_client.h"

#include <memory>
#include <string>
#include <string_view>

#include <arrow/status.h>
#include <grpcpp/client_context.h>

namespace bridge::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

} // namespace

BridgeClient::BridgeClient(std::shared_ptr<grpc::Channel> channel)
    : bridge_stub_(bridge::v1::BridgeService::NewStub(channel)),
      relay_stub_(bridge::v1::RelayService::NewStub(channel)),
      admin_stub_(bridge::v1::AdminService::NewStub(channel)) {
}

arrow::Result<uint64_t> BridgeClient::PostRequest(const bridge::v1::CallContext& context, const std::shared_ptr<arrow::Buffer>& payload,
                                                  uint64_t inclusion_reward, uint64_t tally_reward) const {
  if (!payload) {
    return arrow::Status::Invalid("payload buffer is null");
  }

  bridge::v1::PostRequestRequest req;
  *req.mutable_context() = context;
  req.set_payload(payload->ToString());
  req.set_inclusion_reward(inclusion_reward);
  req.set_tally_reward(tally_reward);

  grpc::ClientContext              ctx;
  bridge::v1::PostRequestResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->PostRequest(&ctx, req, &resp), "PostRequest"));
  return resp.id();
}

arrow::Result<uint64_t> BridgeClient::PostRequestRef(const bridge::v1::CallContext& context, const std::string& payload_ref,
                                                     uint64_t inclusion_reward, uint64_t tally_reward) const {
  bridge::v1::PostRequestRequest req;
  *req.mutable_context() = context;
  req.set_payload_ref(payload_ref);
  req.set_inclusion_reward(inclusion_reward);
  req.set_tally_reward(tally_reward);

  grpc::ClientContext              ctx;
  bridge::v1::PostRequestResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->PostRequest(&ctx, req, &resp), "PostRequest"));
  return resp.id();
}

arrow::Result<bridge::v1::Rewards> BridgeClient::UpgradeReward(const bridge::v1::CallContext& context, uint64_t id, uint64_t add_inclusion,
                                                               uint64_t add_tally) const {
  bridge::v1::UpgradeRewardRequest req;
  *req.mutable_context() = context;
  req.set_id(id);
  req.set_add_inclusion(add_inclusion);
  req.set_add_tally(add_tally);

  grpc::ClientContext                ctx;
  bridge::v1::UpgradeRewardResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->UpgradeReward(&ctx, req, &resp), "UpgradeReward"));
  return resp.rewards();
}

arrow::Result<std::vector<bool>> BridgeClient::CheckClaimability(const std::vector<uint64_t>& ids) const {
  bridge::v1::CheckClaimabilityRequest req;
  for (auto id : ids) req.add_ids(id);

  grpc::ClientContext                    ctx;
  bridge::v1::CheckClaimabilityResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->CheckClaimability(&ctx, req, &resp), "CheckClaimability"));
  return std::vector<bool>(resp.claimable().begin(), resp.claimable().end());
}

arrow::Status BridgeClient::ClaimRequests(const bridge::v1::ClaimRequestsRequest& request) const {
  grpc::ClientContext                ctx;
  bridge::v1::ClaimRequestsResponse resp;
  return GrpcToArrow(bridge_stub_->ClaimRequests(&ctx, request, &resp), "ClaimRequests");
}

arrow::Result<std::string> BridgeClient::ReportInclusion(const bridge::v1::ReportInclusionRequest& request) const {
  grpc::ClientContext                  ctx;
  bridge::v1::ReportInclusionResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReportInclusion(&ctx, request, &resp), "ReportInclusion"));
  return resp.inclusion_proof_hash();
}

arrow::Status BridgeClient::ReportResult(const bridge::v1::ReportResultRequest& request) const {
  grpc::ClientContext               ctx;
  bridge::v1::ReportResultResponse resp;
  return GrpcToArrow(bridge_stub_->ReportResult(&ctx, request, &resp), "ReportResult");
}

arrow::Result<bridge::v1::RequestInfo> BridgeClient::ReadRequest(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext              ctx;
  bridge::v1::ReadRequestResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadRequest(&ctx, req, &resp), "ReadRequest"));
  return resp.info();
}

arrow::Result<std::shared_ptr<arrow::Buffer>> BridgeClient::ReadPayload(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext              ctx;
  bridge::v1::ReadPayloadResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadPayload(&ctx, req, &resp), "ReadPayload"));
  return arrow::Buffer::FromString(std::move(*resp.mutable_payload()));
}

arrow::Result<std::string> BridgeClient::ReadResult(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext             ctx;
  bridge::v1::ReadResultResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadResult(&ctx, req, &resp), "ReadResult"));
  return resp.result();
}

arrow::Result<bridge::v1::Rewards> BridgeClient::ReadRewards(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext              ctx;
  bridge::v1::ReadRewardsResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadRewards(&ctx, req, &resp), "ReadRewards"));
  return resp.rewards();
}

arrow::Result<std::string> BridgeClient::ReadProofHash(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext                ctx;
  bridge::v1::ReadProofHashResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadProofHash(&ctx, req, &resp), "ReadProofHash"));
  return resp.inclusion_proof_hash();
}

arrow::Result<bool> BridgeClient::IsResolved(uint64_t id) const {
  bridge::v1::RequestIdRequest req;
  req.set_id(id);

  grpc::ClientContext             ctx;
  bridge::v1::IsResolvedResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->IsResolved(&ctx, req, &resp), "IsResolved"));
  return resp.resolved();
}

arrow::Result<bridge::v1::EstimateGasCostResponse> BridgeClient::EstimateGasCost(uint64_t gas_price) const {
  bridge::v1::EstimateGasCostRequest req;
  req.set_gas_price(gas_price);

  grpc::ClientContext                  ctx;
  bridge::v1::EstimateGasCostResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->EstimateGasCost(&ctx, req, &resp), "EstimateGasCost"));
  return resp;
}

arrow::Result<uint64_t> BridgeClient::ReadBalance(const std::string& address) const {
  bridge::v1::ReadBalanceRequest req;
  req.set_address(address);

  grpc::ClientContext              ctx;
  bridge::v1::ReadBalanceResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(bridge_stub_->ReadBalance(&ctx, req, &resp), "ReadBalance"));
  return resp.amount();
}

arrow::Status BridgeClient::PostBlock(const bridge::v1::PostBlockRequest& request) const {
  grpc::ClientContext            ctx;
  bridge::v1::PostBlockResponse resp;
  return GrpcToArrow(relay_stub_->PostBlock(&ctx, request, &resp), "PostBlock");
}

arrow::Result<bridge::v1::CurrentEpochResponse> BridgeClient::CurrentEpoch() const {
  grpc::ClientContext               ctx;
  bridge::v1::CurrentEpochRequest  req;
  bridge::v1::CurrentEpochResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(relay_stub_->CurrentEpoch(&ctx, req, &resp), "CurrentEpoch"));
  return resp;
}

arrow::Result<bridge::v1::StatsResponse> BridgeClient::Stats() const {
  grpc::ClientContext        ctx;
  bridge::v1::StatsRequest  req;
  bridge::v1::StatsResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Stats(&ctx, req, &resp), "Stats"));
  return resp;
}

arrow::Result<std::vector<bridge::v1::Event>> BridgeClient::ReadEvents(uint64_t from_offset, uint64_t max_events) const {
  bridge::v1::ReadEventsRequest req;
  req.set_from_offset(from_offset);
  req.set_max_events(max_events);

  grpc::ClientContext             ctx;
  bridge::v1::ReadEventsResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ReadEvents(&ctx, req, &resp), "ReadEvents"));
  return std::vector<bridge::v1::Event>(resp.events().begin(), resp.events().end());
}

} // namespace bridge::client
