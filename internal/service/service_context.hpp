#pragma once

#include <memory>

namespace bridge::core { class BridgeBoard; }
namespace bridge::relay { class LocalBlockRelay; }
namespace bridge::abs { class ActiveBridgeSet; }
namespace bridge::payload { class RamPayloadStore; }
namespace bridge::host { class BlockClock; }

namespace bridge::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<bridge::core::BridgeBoard> board;
  std::shared_ptr<bridge::relay::LocalBlockRelay> relay;
  std::shared_ptr<bridge::abs::ActiveBridgeSet> population;
  std::shared_ptr<bridge::payload::RamPayloadStore> payloads;
  std::shared_ptr<bridge::host::BlockClock> clock;
};

}
