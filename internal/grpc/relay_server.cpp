#include "relay_server.hpp"
#include "grpc_error.hpp"

namespace bridge::grpc {

RelayServer::RelayServer(std::shared_ptr<bridge::service::RelayService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RelayServer::PostBlock(::grpc::ServerContext*,
                                      const bridge::v1::PostBlockRequest* req,
                                      bridge::v1::PostBlockResponse*) {
  try {
    service_->PostBlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RelayServer::CurrentEpoch(::grpc::ServerContext*,
                                         const bridge::v1::CurrentEpochRequest* req,
                                         bridge::v1::CurrentEpochResponse* resp) {
  try {
    *resp = service_->CurrentEpoch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
