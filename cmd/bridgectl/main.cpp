#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "bridge/v1.hpp"

using namespace bridge::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  bridgectl <addr> post <caller> <payload> <inclusion> <tally> <value> <gas_price>\n"
            << "  bridgectl <addr> upgrade <caller> <id> <add_inclusion> <add_tally> <value> <gas_price>\n"
            << "  bridgectl <addr> claimable <id,id,...>\n"
            << "  bridgectl <addr> claim <caller> <id,id,...> <vrf_proof> <public_key> <u_point> <v_components> <signature>\n"
            << "  bridgectl <addr> include <caller> <id> <block_hash> <epoch> <index> [proof,proof,...]\n"
            << "  bridgectl <addr> report <caller> <id> <block_hash> <epoch> <index> <result> [proof,proof,...]\n"
            << "  bridgectl <addr> read <id>\n"
            << "  bridgectl <addr> payload <id>\n"
            << "  bridgectl <addr> result <id>\n"
            << "  bridgectl <addr> resolved <id>\n"
            << "  bridgectl <addr> estimate <gas_price>\n"
            << "  bridgectl <addr> balance <address>\n"
            << "  bridgectl <addr> post-block <relayer> <block_hash> <epoch> <request_root> <tally_root>\n"
            << "  bridgectl <addr> epoch\n"
            << "  bridgectl <addr> stats\n"
            << "  bridgectl <addr> events [from_offset] [max_events]\n"
            << "Byte arguments are hex, with or without 0x.\n";
}

static int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

static std::string FromHex(const std::string& s) {
  std::string hex = s;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex = hex.substr(2);
  }
  if (hex.size() % 2 != 0) {
    std::cerr << "invalid hex: odd length in '" << s << "'\n";
    std::exit(1);
  }

  std::string bytes(hex.size() / 2, '\0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      std::cerr << "invalid hex: non-hex character in '" << s << "'\n";
      std::exit(1);
    }
    bytes[i] = static_cast<char>((hi << 4) | lo);
  }
  return bytes;
}

static std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out    = "0x";
  out.reserve(2 + bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

static std::vector<std::string> SplitList(const std::string& list) {
  std::vector<std::string> out;
  std::stringstream        in(list);
  std::string              item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static CallContext MakeContext(const std::string& caller, const std::string& value, const std::string& gas_price) {
  CallContext ctx;
  ctx.set_caller(FromHex(caller));
  ctx.set_value(std::stoull(value));
  ctx.set_gas_price(std::stoull(gas_price));
  return ctx;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintRewards(const Rewards& rewards) {
  std::cout << "inclusion=" << rewards.inclusion_reward() << "\n";
  std::cout << "tally=" << rewards.tally_reward() << "\n";
  std::cout << "block=" << rewards.block_reward() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto bridge_stub = BridgeService::NewStub(channel);
  auto relay_stub  = RelayService::NewStub(channel);
  auto admin_stub  = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "post") {
    if (argc < 9) return 1;

    PostRequestRequest req;
    *req.mutable_context() = MakeContext(argv[3], argv[7], argv[8]);
    req.set_payload(FromHex(argv[4]));
    req.set_inclusion_reward(std::stoull(argv[5]));
    req.set_tally_reward(std::stoull(argv[6]));

    PostRequestResponse resp;
    auto status = bridge_stub->PostRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "id=" << resp.id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upgrade") {
    if (argc < 9) return 1;

    UpgradeRewardRequest req;
    *req.mutable_context() = MakeContext(argv[3], argv[7], argv[8]);
    req.set_id(std::stoull(argv[4]));
    req.set_add_inclusion(std::stoull(argv[5]));
    req.set_add_tally(std::stoull(argv[6]));

    UpgradeRewardResponse resp;
    auto status = bridge_stub->UpgradeReward(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRewards(resp.rewards());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claimable") {
    if (argc < 4) return 1;

    CheckClaimabilityRequest req;
    for (const auto& id : SplitList(argv[3])) req.add_ids(std::stoull(id));

    CheckClaimabilityResponse resp;
    auto status = bridge_stub->CheckClaimability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (int i = 0; i < resp.claimable_size(); ++i) {
      std::cout << req.ids(i) << "=" << (resp.claimable(i) ? "claimable" : "taken") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    if (argc < 10) return 1;

    ClaimRequestsRequest req;
    req.mutable_context()->set_caller(FromHex(argv[3]));
    for (const auto& id : SplitList(argv[4])) req.add_ids(std::stoull(id));
    req.set_vrf_proof(FromHex(argv[5]));
    req.set_public_key(FromHex(argv[6]));
    req.set_u_point(FromHex(argv[7]));
    req.set_v_components(FromHex(argv[8]));
    req.set_signature(FromHex(argv[9]));

    ClaimRequestsResponse resp;
    auto status = bridge_stub->ClaimRequests(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "claimed\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "include") {
    if (argc < 8) return 1;

    ReportInclusionRequest req;
    req.mutable_context()->set_caller(FromHex(argv[3]));
    req.set_id(std::stoull(argv[4]));
    req.set_block_hash(FromHex(argv[5]));
    req.set_epoch(std::stoull(argv[6]));
    req.set_index(std::stoull(argv[7]));
    if (argc >= 9) {
      for (const auto& node : SplitList(argv[8])) req.add_proof(FromHex(node));
    }

    ReportInclusionResponse resp;
    auto status = bridge_stub->ReportInclusion(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "inclusion_proof_hash=" << ToHex(resp.inclusion_proof_hash()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report") {
    if (argc < 9) return 1;

    ReportResultRequest req;
    req.mutable_context()->set_caller(FromHex(argv[3]));
    req.set_id(std::stoull(argv[4]));
    req.set_block_hash(FromHex(argv[5]));
    req.set_epoch(std::stoull(argv[6]));
    req.set_index(std::stoull(argv[7]));
    req.set_result(FromHex(argv[8]));
    if (argc >= 10) {
      for (const auto& node : SplitList(argv[9])) req.add_proof(FromHex(node));
    }

    ReportResultResponse resp;
    auto status = bridge_stub->ReportResult(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "reported\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "read" || cmd == "payload" || cmd == "result" || cmd == "resolved") {
    if (argc < 4) return 1;

    RequestIdRequest req;
    req.set_id(std::stoull(argv[3]));

    if (cmd == "read") {
      ReadRequestResponse resp;
      auto status = bridge_stub->ReadRequest(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& info = resp.info();
      std::cout << "id=" << info.id() << "\n";
      std::cout << "state=" << RequestState_Name(info.state()) << "\n";
      std::cout << "requestor=" << ToHex(info.requestor()) << "\n";
      std::cout << "claimant=" << ToHex(info.claimant()) << "\n";
      std::cout << "claim_block=" << info.claim_block() << "\n";
      std::cout << "epoch=" << info.epoch() << "\n";
      std::cout << "gas_price=" << info.gas_price() << "\n";
      PrintRewards(info.rewards());
      return 0;
    }
    if (cmd == "payload") {
      ReadPayloadResponse resp;
      auto status = bridge_stub->ReadPayload(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << ToHex(resp.payload()) << "\n";
      return 0;
    }
    if (cmd == "result") {
      ReadResultResponse resp;
      auto status = bridge_stub->ReadResult(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << ToHex(resp.result()) << "\n";
      return 0;
    }

    IsResolvedResponse resp;
    auto status = bridge_stub->IsResolved(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.resolved() ? "resolved" : "pending") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "estimate") {
    if (argc < 4) return 1;

    EstimateGasCostRequest req;
    req.set_gas_price(std::stoull(argv[3]));

    EstimateGasCostResponse resp;
    auto status = bridge_stub->EstimateGasCost(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "min_inclusion=" << resp.min_inclusion() << "\n";
    std::cout << "min_tally=" << resp.min_tally() << "\n";
    std::cout << "min_block=" << resp.min_block() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (argc < 4) return 1;

    ReadBalanceRequest req;
    req.set_address(FromHex(argv[3]));

    ReadBalanceResponse resp;
    auto status = bridge_stub->ReadBalance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "amount=" << resp.amount() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "post-block") {
    if (argc < 8) return 1;

    PostBlockRequest req;
    req.set_relayer(FromHex(argv[3]));
    req.set_block_hash(FromHex(argv[4]));
    req.set_epoch(std::stoull(argv[5]));
    req.set_request_root(FromHex(argv[6]));
    req.set_tally_root(FromHex(argv[7]));

    PostBlockResponse resp;
    auto status = relay_stub->PostBlock(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "posted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "epoch") {
    CurrentEpochRequest  req;
    CurrentEpochResponse resp;
    auto status = relay_stub->CurrentEpoch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "epoch=" << resp.epoch() << "\n";
    std::cout << "beacon=" << ToHex(resp.beacon()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total=" << resp.requests_total() << "\n";
    std::cout << "posted=" << resp.requests_posted() << "\n";
    std::cout << "claimed=" << resp.requests_claimed() << "\n";
    std::cout << "included=" << resp.requests_included() << "\n";
    std::cout << "resulted=" << resp.requests_resulted() << "\n";
    std::cout << "active_reporters=" << resp.active_reporters() << "\n";
    std::cout << "block=" << resp.block_number() << "\n";
    std::cout << "deposited=" << resp.deposited_total() << "\n";
    std::cout << "escrowed=" << resp.escrowed_total() << "\n";
    std::cout << "balances=" << resp.balances_total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "events") {
    ReadEventsRequest req;
    req.set_from_offset(argc >= 4 ? std::stoull(argv[3]) : 0);
    req.set_max_events(argc >= 5 ? std::stoull(argv[4]) : 0);

    ReadEventsResponse resp;
    auto status = admin_stub->ReadEvents(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& event : resp.events()) {
      std::cout << event.offset() << " " << EventKind_Name(event.kind()) << " request=" << event.request_id()
                << " address=" << ToHex(event.address()) << " amount=" << event.amount();
      if (event.payout() != PAYOUT_KIND_UNSPECIFIED) {
        std::cout << " payout=" << PayoutKind_Name(event.payout());
      }
      std::cout << " block=" << event.block() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
