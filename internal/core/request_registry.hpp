#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bridge/v1/types.pb.h"
#include "internal/collab/block_relay.hpp"
#include "internal/collab/payload_source.hpp"
#include "internal/core/board_params.hpp"
#include "internal/core/gas_estimator.hpp"
#include "internal/core/ledger.hpp"
#include "internal/host/call_context.hpp"

namespace bridge::core {

/*
  Owns the dense, handle-indexed collection of data requests.

  Callers must hold a Ledger::Scope.
*/
class RequestRegistry {
 public:
  RequestRegistry(Ledger& ledger, collab::PayloadSource& payloads, collab::BlockRelay& relay, const GasEstimator& estimator,
                  BoardParams params);

  // ctx.value is the deposit; whatever is not earmarked becomes the block reward.
  uint64_t Create(const host::CallContext& ctx, const std::string& payload_ref, util::Amount inclusion_reward, util::Amount tally_reward);

  RewardPools UpgradeReward(const host::CallContext& ctx, uint64_t id, util::Amount add_inclusion, util::Amount add_tally);

  std::vector<bool> CheckClaimability(const std::vector<uint64_t>& ids, uint64_t block_number);

  bridge::v1::RequestInfo ReadRequest(uint64_t id, uint64_t block_number);
  RewardPools             ReadRewards(uint64_t id);
  util::Hash256           ReadProofHash(uint64_t id);
  util::Bytes             ReadResult(uint64_t id);
  bool                    IsResolved(uint64_t id);

  // Re-hashes the referenced payload; throws ValidationError on mismatch.
  util::Bytes ReadPayload(uint64_t id);

  uint64_t Count();

 private:
  Ledger&                ledger_;
  collab::PayloadSource& payloads_;
  collab::BlockRelay&    relay_;
  const GasEstimator&    estimator_;
  BoardParams            params_;
};

} // namespace bridge::core
