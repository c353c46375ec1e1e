#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/bridge_client.h"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  bridge::client::BridgeClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  auto result = client.Stats();
  if (!result.ok()) {
    std::cerr << "Stats RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& stats = result.ValueOrDie();
  std::cout << "Bridge node stats for " << target << " at block " << stats.block_number() << '\n';
  std::cout << "requests: total=" << stats.requests_total() << ", posted=" << stats.requests_posted() << ", claimed=" << stats.requests_claimed()
            << ", included=" << stats.requests_included() << ", resulted=" << stats.requests_resulted() << '\n';
  std::cout << "active reporters: " << stats.active_reporters() << '\n';

  return 0;
}
