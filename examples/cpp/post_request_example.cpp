#include <arrow/buffer.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/bridge_client.h"

int main(int argc, char** argv) {
  const std::string target    = argc > 1 ? argv[1] : "localhost:50061";
  const uint64_t    gas_price = argc > 2 ? std::stoull(argv[2]) : 1;

  bridge::client::BridgeClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Price the request first so the deposit covers every pool.
  auto minimums = client.EstimateGasCost(gas_price);
  if (!minimums.ok()) {
    std::cerr << "EstimateGasCost failed: " << minimums.status().ToString() << '\n';
    return 1;
  }
  const uint64_t inclusion = minimums->min_inclusion();
  const uint64_t tally     = minimums->min_tally();
  const uint64_t deposit   = inclusion + tally + minimums->min_block();

  bridge::v1::CallContext context;
  context.set_caller(std::string(20, '\x11'));
  context.set_value(deposit);
  context.set_gas_price(gas_price);

  auto payload = arrow::Buffer::FromString("GET https://api.example.org/price?pair=ETHUSD");
  auto id      = client.PostRequest(context, payload, inclusion, tally);
  if (!id.ok()) {
    std::cerr << "PostRequest failed: " << id.status().ToString() << '\n';
    return 1;
  }

  auto rewards = client.ReadRewards(*id);
  if (!rewards.ok()) {
    std::cerr << "ReadRewards failed: " << rewards.status().ToString() << '\n';
    return 1;
  }

  std::cout << "posted request " << *id << " with deposit " << deposit << '\n';
  std::cout << "rewards: inclusion=" << rewards->inclusion_reward() << ", tally=" << rewards->tally_reward() << ", block=" << rewards->block_reward()
            << '\n';
  return 0;
}
