#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "bridge/v1.hpp"
#include "internal/service/bridge_service.hpp"

namespace bridge::grpc {

class BridgeServer final : public bridge::v1::BridgeService::Service {
public:
  explicit BridgeServer(std::shared_ptr<bridge::service::BridgeService> svc);

  ::grpc::Status PostRequest(::grpc::ServerContext* ctx,
                             const bridge::v1::PostRequestRequest* req,
                             bridge::v1::PostRequestResponse* resp) override;

  ::grpc::Status UpgradeReward(::grpc::ServerContext* ctx,
                               const bridge::v1::UpgradeRewardRequest* req,
                               bridge::v1::UpgradeRewardResponse* resp) override;

  ::grpc::Status CheckClaimability(::grpc::ServerContext* ctx,
                                   const bridge::v1::CheckClaimabilityRequest* req,
                                   bridge::v1::CheckClaimabilityResponse* resp) override;

  ::grpc::Status ClaimRequests(::grpc::ServerContext* ctx,
                               const bridge::v1::ClaimRequestsRequest* req,
                               bridge::v1::ClaimRequestsResponse* resp) override;

  ::grpc::Status ReportInclusion(::grpc::ServerContext* ctx,
                                 const bridge::v1::ReportInclusionRequest* req,
                                 bridge::v1::ReportInclusionResponse* resp) override;

  ::grpc::Status ReportResult(::grpc::ServerContext* ctx,
                              const bridge::v1::ReportResultRequest* req,
                              bridge::v1::ReportResultResponse* resp) override;

  ::grpc::Status ReadRequest(::grpc::ServerContext* ctx,
                             const bridge::v1::RequestIdRequest* req,
                             bridge::v1::ReadRequestResponse* resp) override;

  ::grpc::Status ReadPayload(::grpc::ServerContext* ctx,
                             const bridge::v1::RequestIdRequest* req,
                             bridge::v1::ReadPayloadResponse* resp) override;

  ::grpc::Status ReadResult(::grpc::ServerContext* ctx,
                            const bridge::v1::RequestIdRequest* req,
                            bridge::v1::ReadResultResponse* resp) override;

  ::grpc::Status ReadRewards(::grpc::ServerContext* ctx,
                             const bridge::v1::RequestIdRequest* req,
                             bridge::v1::ReadRewardsResponse* resp) override;

  ::grpc::Status ReadProofHash(::grpc::ServerContext* ctx,
                               const bridge::v1::RequestIdRequest* req,
                               bridge::v1::ReadProofHashResponse* resp) override;

  ::grpc::Status IsResolved(::grpc::ServerContext* ctx,
                            const bridge::v1::RequestIdRequest* req,
                            bridge::v1::IsResolvedResponse* resp) override;

  ::grpc::Status EstimateGasCost(::grpc::ServerContext* ctx,
                                 const bridge::v1::EstimateGasCostRequest* req,
                                 bridge::v1::EstimateGasCostResponse* resp) override;

  ::grpc::Status ReadBalance(::grpc::ServerContext* ctx,
                             const bridge::v1::ReadBalanceRequest* req,
                             bridge::v1::ReadBalanceResponse* resp) override;

private:
  std::shared_ptr<bridge::service::BridgeService> service_;
};

}
