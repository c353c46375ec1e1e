#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bridge/v1/admin_service.pb.h"
#include "bridge/v1/types.pb.h"
#include "internal/collab/block_relay.hpp"
#include "internal/collab/payload_source.hpp"
#include "internal/collab/reporter_population.hpp"
#include "internal/core/board_params.hpp"
#include "internal/core/claim_gate.hpp"
#include "internal/core/gas_estimator.hpp"
#include "internal/core/ledger.hpp"
#include "internal/core/request_registry.hpp"
#include "internal/core/settlement.hpp"
#include "internal/crypto/signature.hpp"
#include "internal/crypto/vrf.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/host/call_context.hpp"

namespace bridge::core {

/*
  Public capability of the data request board.

  Every operation is atomic: it applies all of its effects or none.
  Errors are util::ValidationError, StateError, AuthorizationError or
  ProofError.
*/
class DataRequestBoard {
 public:
  virtual ~DataRequestBoard() = default;

  virtual uint64_t    PostRequest(const host::CallContext& ctx, const std::string& payload_ref, util::Amount inclusion_reward,
                                  util::Amount tally_reward)                                                                  = 0;
  virtual RewardPools UpgradeReward(const host::CallContext& ctx, uint64_t id, util::Amount add_inclusion, util::Amount add_tally) = 0;
  virtual std::vector<bool> CheckClaimability(const std::vector<uint64_t>& ids, uint64_t block_number)                           = 0;
  virtual void              ClaimRequests(const host::CallContext& ctx, const ClaimSubmission& submission)                      = 0;
  virtual util::Hash256     ReportInclusion(const host::CallContext& ctx, const InclusionReport& report)                        = 0;
  virtual void              ReportResult(const host::CallContext& ctx, const ResultReport& report)                              = 0;

  virtual bridge::v1::RequestInfo ReadRequest(uint64_t id, uint64_t block_number) = 0;
  virtual util::Bytes             ReadPayload(uint64_t id)                        = 0;
  virtual util::Bytes             ReadResult(uint64_t id)                         = 0;
  virtual RewardPools             ReadRewards(uint64_t id)                        = 0;
  virtual util::Hash256           ReadProofHash(uint64_t id)                      = 0;
  virtual bool                    IsResolved(uint64_t id)                         = 0;
  virtual MinimumRewards          EstimateGasCost(util::Amount gas_price)         = 0;
  virtual util::Amount            ReadBalance(const util::Address& address)       = 0;
  virtual uint64_t                RequestCount()                                  = 0;
};

struct BoardDeps {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<collab::PayloadSource>      payloads;
  std::shared_ptr<collab::BlockRelay>         relay;
  std::shared_ptr<collab::ReporterPopulation> population;
  std::shared_ptr<crypto::VrfVerifier>        vrf;
  std::shared_ptr<crypto::SignatureScheme>    signatures;
};

class BridgeBoard final : public DataRequestBoard {
 public:
  BridgeBoard(BoardDeps deps, BoardParams params, GasCosts costs);

  uint64_t    PostRequest(const host::CallContext& ctx, const std::string& payload_ref, util::Amount inclusion_reward,
                          util::Amount tally_reward) override;
  RewardPools UpgradeReward(const host::CallContext& ctx, uint64_t id, util::Amount add_inclusion, util::Amount add_tally) override;
  std::vector<bool> CheckClaimability(const std::vector<uint64_t>& ids, uint64_t block_number) override;
  void              ClaimRequests(const host::CallContext& ctx, const ClaimSubmission& submission) override;
  util::Hash256     ReportInclusion(const host::CallContext& ctx, const InclusionReport& report) override;
  void              ReportResult(const host::CallContext& ctx, const ResultReport& report) override;

  bridge::v1::RequestInfo ReadRequest(uint64_t id, uint64_t block_number) override;
  util::Bytes             ReadPayload(uint64_t id) override;
  util::Bytes             ReadResult(uint64_t id) override;
  RewardPools             ReadRewards(uint64_t id) override;
  util::Hash256           ReadProofHash(uint64_t id) override;
  bool                    IsResolved(uint64_t id) override;
  MinimumRewards          EstimateGasCost(util::Amount gas_price) override;
  util::Amount            ReadBalance(const util::Address& address) override;
  uint64_t                RequestCount() override;

  // Admin surface.
  bridge::v1::StatsResponse           Stats(uint64_t block_number);
  std::vector<db::model::EventRecord> ReadEvents(uint64_t from_offset, std::optional<uint64_t> max_events);

  const BoardParams& Params() const {
    return params_;
  }

 private:
  template <typename Fn>
  auto Atomic(Fn&& fn) -> decltype(fn());

  BoardDeps       deps_;
  BoardParams     params_;
  GasEstimator    estimator_;
  Ledger          ledger_;
  RequestRegistry registry_;
  ClaimGate       gate_;
  Settlement      settlement_;
};

} // namespace bridge::core
