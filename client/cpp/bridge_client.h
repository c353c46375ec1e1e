#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "bridge/v1.hpp"

namespace bridge::client {

/*
  Synchronous client for a bridge node.

  Byte fields (addresses, hashes, proofs) are raw bytes in std::string,
  the way protobuf carries them.
*/
class BridgeClient {
 public:
  explicit BridgeClient(std::shared_ptr<grpc::Channel> channel);

  // Inline payload; the node stores it and returns the request id.
  arrow::Result<uint64_t> PostRequest(const bridge::v1::CallContext& context, const std::shared_ptr<arrow::Buffer>& payload,
                                      uint64_t inclusion_reward, uint64_t tally_reward) const;

  arrow::Result<uint64_t> PostRequestRef(const bridge::v1::CallContext& context, const std::string& payload_ref, uint64_t inclusion_reward,
                                         uint64_t tally_reward) const;

  arrow::Result<bridge::v1::Rewards> UpgradeReward(const bridge::v1::CallContext& context, uint64_t id, uint64_t add_inclusion,
                                                   uint64_t add_tally) const;

  arrow::Result<std::vector<bool>> CheckClaimability(const std::vector<uint64_t>& ids) const;

  arrow::Status ClaimRequests(const bridge::v1::ClaimRequestsRequest& request) const;

  arrow::Result<std::string> ReportInclusion(const bridge::v1::ReportInclusionRequest& request) const;

  arrow::Status ReportResult(const bridge::v1::ReportResultRequest& request) const;

  arrow::Result<bridge::v1::RequestInfo> ReadRequest(uint64_t id) const;

  arrow::Result<std::shared_ptr<arrow::Buffer>> ReadPayload(uint64_t id) const;

  arrow::Result<std::string> ReadResult(uint64_t id) const;

  arrow::Result<bridge::v1::Rewards> ReadRewards(uint64_t id) const;

  arrow::Result<std::string> ReadProofHash(uint64_t id) const;

  arrow::Result<bool> IsResolved(uint64_t id) const;

  arrow::Result<bridge::v1::EstimateGasCostResponse> EstimateGasCost(uint64_t gas_price) const;

  arrow::Result<uint64_t> ReadBalance(const std::string& address) const;

  arrow::Status PostBlock(const bridge::v1::PostBlockRequest& request) const;

  arrow::Result<bridge::v1::CurrentEpochResponse> CurrentEpoch() const;

  arrow::Result<bridge::v1::StatsResponse> Stats() const;

  arrow::Result<std::vector<bridge::v1::Event>> ReadEvents(uint64_t from_offset, uint64_t max_events = 0) const;

 private:
  std::unique_ptr<bridge::v1::BridgeService::Stub> bridge_stub_;
  std::unique_ptr<bridge::v1::RelayService::Stub>  relay_stub_;
  std::unique_ptr<bridge::v1::AdminService::Stub>  admin_stub_;
};

} // namespace bridge::client
