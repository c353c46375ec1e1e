#include "admin_service.hpp"

#include <optional>

#include "internal/core/board.hpp"
#include "internal/host/block_clock.hpp"
#include "observe_rpc.hpp"

namespace bridge::service {

using namespace bridge::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", 0, [&] { return ctx_.board->Stats(ctx_.clock->Current()); });
}

ReadEventsResponse AdminService::ReadEvents(const ReadEventsRequest& req) {
  return ObserveRpc("AdminService.ReadEvents", 0, [&] {
    std::optional<uint64_t> max_events;
    if (req.max_events() != 0) {
      max_events = req.max_events();
    }

    ReadEventsResponse resp;
    for (const auto& record : ctx_.board->ReadEvents(req.from_offset(), max_events)) {
      auto* event = resp.add_events();
      event->set_offset(record.offset);
      event->set_kind(record.kind);
      event->set_request_id(record.request_id);
      event->set_address(util::ToString(record.address));
      event->set_amount(record.amount);
      event->set_payout(record.payout);
      event->set_block(record.block);
    }
    return resp;
  });
}

}
