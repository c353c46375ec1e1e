#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace bridge::core { class BridgeBoard; }
namespace bridge::db { class Repository; }
namespace bridge::relay { class LocalBlockRelay; }
namespace bridge::abs { class ActiveBridgeSet; }
namespace bridge::payload { class RamPayloadStore; }
namespace bridge::host { class BlockClock; }

namespace bridge::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<host::BlockClock> clock;
  std::shared_ptr<relay::LocalBlockRelay> relay;
  std::shared_ptr<abs::ActiveBridgeSet> population;
  std::shared_ptr<payload::RamPayloadStore> payloads;
  std::shared_ptr<core::BridgeBoard> board;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and crypto types.
*/
Application Build(const bridge::runtime::config::RuntimeConfig& config);

}
