#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using bridge::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: bridge-node <config.yaml> OR bridge-node --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = bridge::config::ConfigLoader::LoadFromYaml(config_path);

    bridge::observability::InitializeTracing(config);
    bridge::observability::InitializeMetrics(config);
    bridge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = bridge::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BRIDGE_LOG_INFO("bridge node started", {bridge::observability::StringField("bind_address", config.server().bind_address()),
                                            bridge::observability::UintField("claim_expiry_blocks", config.board().claim_expiry_blocks()),
                                            bridge::observability::UintField("replication_factor", config.board().replication_factor())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BRIDGE_LOG_INFO("Shutting down bridge node");

    server.Stop();
    bridge::observability::ShutdownLogging();
    bridge::observability::ShutdownMetrics();
    bridge::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    BRIDGE_LOG_ERROR("Fatal error", {bridge::observability::StringField("error", e.what())});
    bridge::observability::ShutdownLogging();
    bridge::observability::ShutdownMetrics();
    bridge::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
