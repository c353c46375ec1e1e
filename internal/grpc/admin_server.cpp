#include "admin_server.hpp"
#include "grpc_error.hpp"

namespace bridge::grpc {

AdminServer::AdminServer(std::shared_ptr<bridge::service::AdminService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*,
                                  const bridge::v1::StatsRequest* req,
                                  bridge::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ReadEvents(::grpc::ServerContext*,
                                       const bridge::v1::ReadEventsRequest* req,
                                       bridge::v1::ReadEventsResponse* resp) {
  try {
    *resp = service_->ReadEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
