#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "bridge/v1.hpp"
#include "internal/service/admin_service.hpp"

namespace bridge::grpc {

class AdminServer final : public bridge::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<bridge::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext* ctx,
                       const bridge::v1::StatsRequest* req,
                       bridge::v1::StatsResponse* resp) override;

  ::grpc::Status ReadEvents(::grpc::ServerContext* ctx,
                            const bridge::v1::ReadEventsRequest* req,
                            bridge::v1::ReadEventsResponse* resp) override;

private:
  std::shared_ptr<bridge::service::AdminService> service_;
};

}
