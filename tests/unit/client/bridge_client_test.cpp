#include <arrow/buffer.h>
#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>

#include "client/cpp/bridge_client.h"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/bridge_server.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/bridge_service.hpp"
#include "internal/service/relay_service.hpp"
#include "support/board_harness.hpp"

namespace {

using bridge::client::BridgeClient;
using bridge::testing::Addr;
using bridge::testing::BoardHarness;
using bridge::testing::FakeSignatures;
using bridge::testing::FakeVrf;
using bridge::testing::Hash;
using bridge::testing::KeyOf;
using bridge::util::ToString;

// Node services behind an in-process channel.
struct InProcessNode {
  BoardHarness                  harness;
  std::vector<std::unique_ptr<::grpc::Service>> services;
  std::unique_ptr<::grpc::Server>               server;
  std::unique_ptr<BridgeClient>                 client;

  InProcessNode() {
    bridge::service::ServiceContext ctx;
    ctx.board      = std::shared_ptr<bridge::core::BridgeBoard>(std::move(harness.board));
    ctx.relay      = harness.relay;
    ctx.population = harness.population;
    ctx.payloads   = harness.payloads;
    ctx.clock      = harness.clock;

    services.push_back(std::make_unique<bridge::grpc::BridgeServer>(std::make_shared<bridge::service::BridgeService>(ctx)));
    services.push_back(std::make_unique<bridge::grpc::RelayServer>(std::make_shared<bridge::service::RelayService>(ctx)));
    services.push_back(std::make_unique<bridge::grpc::AdminServer>(std::make_shared<bridge::service::AdminService>(ctx)));

    ::grpc::ServerBuilder builder;
    for (auto& service : services) {
      builder.RegisterService(service.get());
    }
    server = builder.BuildAndStart();
    assert(server);
    client = std::make_unique<BridgeClient>(server->InProcessChannel(::grpc::ChannelArguments()));
  }

  ~InProcessNode() {
    server->Shutdown();
  }
};

bridge::v1::CallContext Caller(uint8_t tag, uint64_t value = 0) {
  bridge::v1::CallContext context;
  context.set_caller(ToString(Addr(tag)));
  context.set_value(value);
  context.set_gas_price(1);
  return context;
}

void TestLifecycleOverTheWire() {
  InProcessNode node;
  auto&         client = *node.client;

  auto id = client.PostRequest(Caller(1, 10'000'000), arrow::Buffer::FromString("GET /price"), 3'000'000, 3'000'000);
  assert(id.ok());
  assert(*id == 1);

  auto payload = client.ReadPayload(*id);
  assert(payload.ok());
  assert((*payload)->ToString() == "GET /price");

  auto claimable = client.CheckClaimability({*id});
  assert(claimable.ok() && claimable->size() == 1 && (*claimable)[0]);

  // Claim against the beacon reported by the relay service.
  auto epoch = client.CurrentEpoch();
  assert(epoch.ok());
  bridge::v1::ClaimRequestsRequest claim;
  *claim.mutable_context() = Caller(7);
  claim.add_ids(*id);
  const auto key = KeyOf(7);
  claim.set_public_key(ToString(key));
  claim.set_vrf_proof(ToString(FakeVrf::Prove(key, bridge::util::ToBytes(epoch->beacon()), bridge::util::Hash256{})));
  claim.set_signature(ToString(FakeSignatures::Sign(key, Addr(7))));
  assert(client.ClaimRequests(claim).ok());

  auto info = client.ReadRequest(*id);
  assert(info.ok());
  assert(info->state() == bridge::v1::REQUEST_STATE_CLAIMED);

  const auto block = node.harness.RelayBlock(Addr(7), *id, "1850.25", 0x30);

  bridge::v1::ReportInclusionRequest include;
  *include.mutable_context() = Caller(7);
  include.set_id(*id);
  include.add_proof(ToString(block.inclusion_proof.front()));
  include.set_block_hash(ToString(block.hash));
  include.set_epoch(block.epoch);
  auto proof_hash = client.ReportInclusion(include);
  assert(proof_hash.ok());
  assert(proof_hash->size() == 32);
  assert(*client.ReadProofHash(*id) == *proof_hash);

  bridge::v1::ReportResultRequest report;
  *report.mutable_context() = Caller(7);
  report.set_id(*id);
  report.add_proof(ToString(block.result_proof.front()));
  report.set_block_hash(ToString(block.hash));
  report.set_epoch(block.epoch);
  report.set_result("1850.25");
  assert(client.ReportResult(report).ok());

  assert(*client.IsResolved(*id));
  assert(*client.ReadResult(*id) == "1850.25");
  assert(*client.ReadBalance(ToString(Addr(7))) == 10'000'000);

  auto rewards = client.ReadRewards(*id);
  assert(rewards.ok());
  assert(rewards->inclusion_reward() == 0 && rewards->tally_reward() == 0 && rewards->block_reward() == 0);

  auto stats = client.Stats();
  assert(stats.ok());
  assert(stats->requests_total() == 1);
  assert(stats->requests_resulted() == 1);

  auto events = client.ReadEvents(0);
  assert(events.ok());
  assert(!events->empty());
  assert(events->front().kind() == bridge::v1::EVENT_KIND_POSTED_REQUEST);
  auto limited = client.ReadEvents(0, 2);
  assert(limited.ok() && limited->size() == 2);
}

void TestRelayServiceFeedsTheBeacon() {
  InProcessNode node;
  auto&         client = *node.client;

  bridge::v1::PostBlockRequest block;
  block.set_relayer(ToString(Addr(9)));
  block.set_block_hash(ToString(Hash(0x44)));
  block.set_epoch(12);
  block.set_request_root(ToString(Hash(1)));
  block.set_tally_root(ToString(Hash(2)));
  assert(client.PostBlock(block).ok());

  auto epoch = client.CurrentEpoch();
  assert(epoch.ok());
  assert(epoch->epoch() == 12);
  assert(epoch->beacon().size() == 40);

  block.set_block_hash(ToString(Hash(0x45)));
  assert(client.PostBlock(block).IsIOError());
}

void TestErrorsMapToArrowStatus() {
  InProcessNode node;
  auto&         client = *node.client;

  auto missing = client.ReadRequest(99);
  assert(missing.status().IsInvalid());

  auto short_deposit = client.PostRequest(Caller(1, 10), arrow::Buffer::FromString("GET /price"), 3'000'000, 3'000'000);
  assert(short_deposit.status().IsInvalid());

  auto null_payload = client.PostRequest(Caller(1, 10), nullptr, 0, 0);
  assert(null_payload.status().IsInvalid());

  auto estimate = client.EstimateGasCost(2);
  assert(estimate.ok());
  assert(estimate->min_inclusion() == 2 * (187000 + 197000));
  assert(estimate->min_tally() == 2 * 137000);
  assert(estimate->min_block() == 2 * 2 * 97000);
}

} // namespace

int main() {
  TestLifecycleOverTheWire();
  TestRelayServiceFeedsTheBeacon();
  TestErrorsMapToArrowStatus();

  std::cout << "bridge_unit_bridge_client: pass\n";
  return 0;
}
