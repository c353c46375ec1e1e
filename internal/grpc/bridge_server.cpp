#include "bridge_server.hpp"
#include "grpc_error.hpp"

namespace bridge::grpc {

BridgeServer::BridgeServer(std::shared_ptr<bridge::service::BridgeService> svc)
    : service_(std::move(svc)) {}

::grpc::Status BridgeServer::PostRequest(::grpc::ServerContext*,
                                         const bridge::v1::PostRequestRequest* req,
                                         bridge::v1::PostRequestResponse* resp) {
  try {
    *resp = service_->PostRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::UpgradeReward(::grpc::ServerContext*,
                                           const bridge::v1::UpgradeRewardRequest* req,
                                           bridge::v1::UpgradeRewardResponse* resp) {
  try {
    *resp = service_->UpgradeReward(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::CheckClaimability(::grpc::ServerContext*,
                                               const bridge::v1::CheckClaimabilityRequest* req,
                                               bridge::v1::CheckClaimabilityResponse* resp) {
  try {
    *resp = service_->CheckClaimability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ClaimRequests(::grpc::ServerContext*,
                                           const bridge::v1::ClaimRequestsRequest* req,
                                           bridge::v1::ClaimRequestsResponse*) {
  try {
    service_->ClaimRequests(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReportInclusion(::grpc::ServerContext*,
                                             const bridge::v1::ReportInclusionRequest* req,
                                             bridge::v1::ReportInclusionResponse* resp) {
  try {
    *resp = service_->ReportInclusion(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReportResult(::grpc::ServerContext*,
                                          const bridge::v1::ReportResultRequest* req,
                                          bridge::v1::ReportResultResponse*) {
  try {
    service_->ReportResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadRequest(::grpc::ServerContext*,
                                         const bridge::v1::RequestIdRequest* req,
                                         bridge::v1::ReadRequestResponse* resp) {
  try {
    *resp = service_->ReadRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadPayload(::grpc::ServerContext*,
                                         const bridge::v1::RequestIdRequest* req,
                                         bridge::v1::ReadPayloadResponse* resp) {
  try {
    *resp = service_->ReadPayload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadResult(::grpc::ServerContext*,
                                        const bridge::v1::RequestIdRequest* req,
                                        bridge::v1::ReadResultResponse* resp) {
  try {
    *resp = service_->ReadResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadRewards(::grpc::ServerContext*,
                                         const bridge::v1::RequestIdRequest* req,
                                         bridge::v1::ReadRewardsResponse* resp) {
  try {
    *resp = service_->ReadRewards(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadProofHash(::grpc::ServerContext*,
                                           const bridge::v1::RequestIdRequest* req,
                                           bridge::v1::ReadProofHashResponse* resp) {
  try {
    *resp = service_->ReadProofHash(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::IsResolved(::grpc::ServerContext*,
                                        const bridge::v1::RequestIdRequest* req,
                                        bridge::v1::IsResolvedResponse* resp) {
  try {
    *resp = service_->IsResolved(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::EstimateGasCost(::grpc::ServerContext*,
                                             const bridge::v1::EstimateGasCostRequest* req,
                                             bridge::v1::EstimateGasCostResponse* resp) {
  try {
    *resp = service_->EstimateGasCost(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BridgeServer::ReadBalance(::grpc::ServerContext*,
                                         const bridge::v1::ReadBalanceRequest* req,
                                         bridge::v1::ReadBalanceResponse* resp) {
  try {
    *resp = service_->ReadBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
