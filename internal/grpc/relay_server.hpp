#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "bridge/v1.hpp"
#include "internal/service/relay_service.hpp"

namespace bridge::grpc {

class RelayServer final : public bridge::v1::RelayService::Service {
public:
  explicit RelayServer(std::shared_ptr<bridge::service::RelayService> svc);

  ::grpc::Status PostBlock(::grpc::ServerContext* ctx,
                           const bridge::v1::PostBlockRequest* req,
                           bridge::v1::PostBlockResponse* resp) override;

  ::grpc::Status CurrentEpoch(::grpc::ServerContext* ctx,
                              const bridge::v1::CurrentEpochRequest* req,
                              bridge::v1::CurrentEpochResponse* resp) override;

private:
  std::shared_ptr<bridge::service::RelayService> service_;
};

}
