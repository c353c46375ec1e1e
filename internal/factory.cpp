#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/abs/active_bridge_set.hpp"
#include "internal/core/board.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/bridge_server.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/host/block_clock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payload/ram_payload_store.hpp"
#include "internal/relay/local_block_relay.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/bridge_service.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/time.hpp"
#if BRIDGE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BRIDGE_WITH_SODIUM
#include "internal/crypto/sodium_crypto.hpp"
#endif

namespace bridge::factory {

using namespace bridge;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const bridge::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BRIDGE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

void BuildCrypto(const bridge::runtime::config::RuntimeConfig& config, core::BoardDeps& deps) {
  switch (config.crypto().backend()) {
    case bridge::runtime::config::CRYPTO_BACKEND_UNSPECIFIED:
    case bridge::runtime::config::CRYPTO_BACKEND_SODIUM:
#if BRIDGE_WITH_SODIUM
      deps.vrf        = std::make_shared<crypto::SodiumVrfVerifier>();
      deps.signatures = std::make_shared<crypto::SodiumSignatureScheme>();
      return;
#else
      throw std::runtime_error("sodium crypto backend requested but not enabled at build time");
#endif
    default:
      throw std::runtime_error("unknown crypto backend");
  }
}

std::shared_ptr<host::BlockClock> BuildClock(const bridge::runtime::config::RuntimeConfig& config) {
  auto genesis = config.chain().genesis_unix_ms();
  if (genesis == 0) {
    genesis = util::ToUnixMillis(util::Now());
  }
  return std::make_shared<host::IntervalBlockClock>(genesis, config.chain().block_interval_ms());
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const bridge::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Host and collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.clock      = BuildClock(config);
  app.relay      = std::make_shared<relay::LocalBlockRelay>();
  app.payloads   = std::make_shared<payload::RamPayloadStore>();
  app.population = std::make_shared<abs::ActiveBridgeSet>(*app.clock, config.board().activity_window_blocks());

  std::vector<util::Address> bootstrap;
  for (const auto& reporter : config.reporters().bootstrap()) {
    bootstrap.push_back(util::AddressFromHex(reporter));
  }
  app.population->Bootstrap(bootstrap);

  // ------------------------------------------------------------------
  // Board
  // ------------------------------------------------------------------
  core::BoardDeps deps;
  deps.repository = app.repository;
  deps.payloads   = app.payloads;
  deps.relay      = app.relay;
  deps.population = app.population;
  BuildCrypto(config, deps);

  core::BoardParams params;
  params.claim_expiry_blocks = config.board().claim_expiry_blocks();
  params.replication_factor  = config.board().replication_factor();

  core::GasCosts costs;
  costs.claim     = config.gas().claim();
  costs.inclusion = config.gas().inclusion();
  costs.result    = config.gas().result();
  costs.block     = config.gas().block();

  app.board = std::make_shared<core::BridgeBoard>(std::move(deps), params, costs);

  BRIDGE_LOG_INFO("board ready", {observability::UintField("requests", app.board->RequestCount()),
                                  observability::UintField("bootstrap_reporters", bootstrap.size()),
                                  observability::UintField("block", app.clock->Current())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.board      = app.board;
  ctx.relay      = app.relay;
  ctx.population = app.population;
  ctx.payloads   = app.payloads;
  ctx.clock      = app.clock;

  auto bridge_service = std::make_shared<service::BridgeService>(ctx);
  auto relay_service  = std::make_shared<service::RelayService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BridgeServer>(bridge_service));
  app.grpc_services.push_back(std::make_unique<grpc::RelayServer>(relay_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace bridge::factory
