#pragma once

#include "bridge/v1.hpp"
#include "service_context.hpp"

namespace bridge::service {

// Feeds relayed blocks into the in-process block relay.
class RelayService {
public:
  explicit RelayService(ServiceContext ctx);

  void PostBlock(const bridge::v1::PostBlockRequest& req);

  bridge::v1::CurrentEpochResponse CurrentEpoch(const bridge::v1::CurrentEpochRequest& req);

private:
  ServiceContext ctx_;
};

}
