#pragma once

#include "bridge/v1.hpp"
#include "service_context.hpp"

namespace bridge::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  bridge::v1::StatsResponse Stats(const bridge::v1::StatsRequest& req);

  // max_events == 0 reads to the end of the stream.
  bridge::v1::ReadEventsResponse ReadEvents(const bridge::v1::ReadEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
