#include "relay_service.hpp"

#include "internal/relay/local_block_relay.hpp"
#include "observe_rpc.hpp"

namespace bridge::service {

using namespace bridge::v1;

RelayService::RelayService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void RelayService::PostBlock(const PostBlockRequest& req) {
  ObserveRpc("RelayService.PostBlock", 0, [&] {
    ctx_.relay->PostBlock(util::ToAddress(req.relayer()), util::ToHash256(req.block_hash()), req.epoch(), util::ToHash256(req.request_root()),
                          util::ToHash256(req.tally_root()));
  });
}

CurrentEpochResponse RelayService::CurrentEpoch(const CurrentEpochRequest&) {
  return ObserveRpc("RelayService.CurrentEpoch", 0, [&] {
    CurrentEpochResponse resp;
    resp.set_epoch(ctx_.relay->CurrentEpoch());
    resp.set_beacon(util::ToString(ctx_.relay->CurrentBeacon()));
    return resp;
  });
}

}
