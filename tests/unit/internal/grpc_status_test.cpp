#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/grpc/bridge_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/bridge_service.hpp"
#include "support/board_harness.hpp"

namespace {

using bridge::testing::Addr;
using bridge::testing::BoardHarness;

void TestErrorMapping() {
  using ::grpc::StatusCode;
  namespace util = bridge::util;

  assert(bridge::grpc::ToStatus(util::ValidationError("bad handle")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(bridge::grpc::ToStatus(util::StateError("already included")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(bridge::grpc::ToStatus(util::AuthorizationError("VRF proof invalid")).error_code() == StatusCode::PERMISSION_DENIED);
  assert(bridge::grpc::ToStatus(util::ProofError("inclusion proof rejected")).error_code() == StatusCode::ABORTED);
  assert(bridge::grpc::ToStatus(std::runtime_error("disk full")).error_code() == StatusCode::INTERNAL);
  assert(bridge::grpc::ToStatus(util::ValidationError("bad handle")).error_message() == "bad handle");
}

struct ServerRig {
  BoardHarness                          harness;
  std::unique_ptr<bridge::grpc::BridgeServer> server;

  ServerRig() {
    bridge::service::ServiceContext ctx;
    ctx.board      = std::shared_ptr<bridge::core::BridgeBoard>(std::move(harness.board));
    ctx.relay      = harness.relay;
    ctx.population = harness.population;
    ctx.payloads   = harness.payloads;
    ctx.clock      = harness.clock;
    server = std::make_unique<bridge::grpc::BridgeServer>(std::make_shared<bridge::service::BridgeService>(ctx));
  }
};

void TestAdapterReportsBadHandle() {
  ServerRig                          rig;
  ::grpc::ServerContext              context;
  bridge::v1::RequestIdRequest       req;
  bridge::v1::ReadRequestResponse    resp;
  req.set_id(42);

  const auto status = rig.server->ReadRequest(&context, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "bad handle");
}

void TestAdapterReportsMalformedCaller() {
  ServerRig                       rig;
  ::grpc::ServerContext           context;
  bridge::v1::PostRequestRequest  req;
  bridge::v1::PostRequestResponse resp;
  req.mutable_context()->set_caller("short");
  req.mutable_context()->set_value(10);
  req.set_payload("GET /price");

  const auto status = rig.server->PostRequest(&context, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message() == "address must be 20 bytes, got 5");
}

void TestAdapterPostsAndReadsBack() {
  ServerRig             rig;
  ::grpc::ServerContext context;

  bridge::v1::PostRequestRequest post;
  post.mutable_context()->set_caller(bridge::util::ToString(Addr(1)));
  post.mutable_context()->set_value(10'000'000);
  post.mutable_context()->set_gas_price(1);
  post.set_payload("GET /price");
  post.set_inclusion_reward(3'000'000);
  post.set_tally_reward(3'000'000);

  bridge::v1::PostRequestResponse posted;
  assert(rig.server->PostRequest(&context, &post, &posted).ok());
  assert(posted.id() == 1);

  bridge::v1::RequestIdRequest    read;
  bridge::v1::ReadPayloadResponse payload;
  read.set_id(posted.id());
  assert(rig.server->ReadPayload(&context, &read, &payload).ok());
  assert(payload.payload() == "GET /price");

  bridge::v1::ReportResultRequest  report;
  bridge::v1::ReportResultResponse reported;
  report.mutable_context()->set_caller(bridge::util::ToString(Addr(7)));
  report.set_id(posted.id());
  report.set_block_hash(bridge::util::ToString(bridge::testing::Hash(0x30)));
  report.set_epoch(1);
  report.set_result("1");
  assert(rig.server->ReportResult(&context, &report, &reported).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestErrorMapping();
  TestAdapterReportsBadHandle();
  TestAdapterReportsMalformedCaller();
  TestAdapterPostsAndReadsBack();

  std::cout << "bridge_unit_grpc_status: pass\n";
  return 0;
}
