#include "board.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/model/request_state.hpp"
#include "internal/observability/spans.hpp"

namespace bridge::core {

namespace {

template <typename T>
T& Require(const std::shared_ptr<T>& dep, const char* name) {
  if (!dep) {
    throw std::invalid_argument(std::string("board dependency missing: ") + name);
  }
  return *dep;
}

} // namespace

BridgeBoard::BridgeBoard(BoardDeps deps, BoardParams params, GasCosts costs)
    : deps_(std::move(deps)),
      params_(params),
      estimator_(costs),
      ledger_(deps_.repository),
      registry_(ledger_, Require(deps_.payloads, "payloads"), Require(deps_.relay, "relay"), estimator_, params_),
      gate_(ledger_, *deps_.relay, Require(deps_.population, "population"), Require(deps_.vrf, "vrf"), Require(deps_.signatures, "signatures"),
            params_),
      settlement_(ledger_, *deps_.relay, *deps_.population, params_) {
  Require(deps_.repository, "repository");
}

template <typename Fn>
auto BridgeBoard::Atomic(Fn&& fn) -> decltype(fn()) {
  Ledger::Scope scope(ledger_);
  if constexpr (std::is_void_v<decltype(fn())>) {
    fn();
    scope.Commit();
  } else {
    auto out = fn();
    scope.Commit();
    return out;
  }
}

uint64_t BridgeBoard::PostRequest(const host::CallContext& ctx, const std::string& payload_ref, util::Amount inclusion_reward,
                                  util::Amount tally_reward) {
  return Atomic([&] { return registry_.Create(ctx, payload_ref, inclusion_reward, tally_reward); });
}

RewardPools BridgeBoard::UpgradeReward(const host::CallContext& ctx, uint64_t id, util::Amount add_inclusion, util::Amount add_tally) {
  return Atomic([&] { return registry_.UpgradeReward(ctx, id, add_inclusion, add_tally); });
}

std::vector<bool> BridgeBoard::CheckClaimability(const std::vector<uint64_t>& ids, uint64_t block_number) {
  return Atomic([&] { return registry_.CheckClaimability(ids, block_number); });
}

void BridgeBoard::ClaimRequests(const host::CallContext& ctx, const ClaimSubmission& submission) {
  Atomic([&] { gate_.Claim(ctx, submission); });
}

util::Hash256 BridgeBoard::ReportInclusion(const host::CallContext& ctx, const InclusionReport& report) {
  return Atomic([&] { return settlement_.ReportInclusion(ctx, report); });
}

void BridgeBoard::ReportResult(const host::CallContext& ctx, const ResultReport& report) {
  Atomic([&] { settlement_.ReportResult(ctx, report); });
}

bridge::v1::RequestInfo BridgeBoard::ReadRequest(uint64_t id, uint64_t block_number) {
  return Atomic([&] { return registry_.ReadRequest(id, block_number); });
}

util::Bytes BridgeBoard::ReadPayload(uint64_t id) {
  return Atomic([&] { return registry_.ReadPayload(id); });
}

util::Bytes BridgeBoard::ReadResult(uint64_t id) {
  return Atomic([&] { return registry_.ReadResult(id); });
}

RewardPools BridgeBoard::ReadRewards(uint64_t id) {
  return Atomic([&] { return registry_.ReadRewards(id); });
}

util::Hash256 BridgeBoard::ReadProofHash(uint64_t id) {
  return Atomic([&] { return registry_.ReadProofHash(id); });
}

bool BridgeBoard::IsResolved(uint64_t id) {
  return Atomic([&] { return registry_.IsResolved(id); });
}

MinimumRewards BridgeBoard::EstimateGasCost(util::Amount gas_price) {
  return estimator_.Estimate(gas_price);
}

util::Amount BridgeBoard::ReadBalance(const util::Address& address) {
  return Atomic([&] { return ledger_.Balance(address); });
}

uint64_t BridgeBoard::RequestCount() {
  return Atomic([&] { return registry_.Count(); });
}

bridge::v1::StatsResponse BridgeBoard::Stats(uint64_t block_number) {
  auto stats = Atomic([&] {
    bridge::v1::StatsResponse out;
    util::Amount              escrowed  = 0;
    util::Amount              deposited = 0;
    for (const auto& record : ledger_.All()) {
      out.set_requests_total(out.requests_total() + 1);
      escrowed  = util::CheckedAdd(escrowed, record.inclusion_reward + record.tally_reward + record.block_reward);
      deposited = util::CheckedAdd(deposited, record.deposited);
      switch (model::DeriveState(record, block_number, params_.claim_expiry_blocks)) {
        case bridge::v1::REQUEST_STATE_POSTED:
          out.set_requests_posted(out.requests_posted() + 1);
          break;
        case bridge::v1::REQUEST_STATE_CLAIMED:
          out.set_requests_claimed(out.requests_claimed() + 1);
          break;
        case bridge::v1::REQUEST_STATE_INCLUDED:
          out.set_requests_included(out.requests_included() + 1);
          break;
        case bridge::v1::REQUEST_STATE_RESULTED:
          out.set_requests_resulted(out.requests_resulted() + 1);
          break;
        default:
          break;
      }
    }

    util::Amount balances = 0;
    for (const auto& balance : ledger_.Balances()) {
      balances = util::CheckedAdd(balances, balance.amount);
    }
    out.set_deposited_total(deposited);
    out.set_escrowed_total(escrowed);
    out.set_balances_total(balances);
    return out;
  });
  stats.set_active_reporters(deps_.population->ActiveCount());
  stats.set_block_number(block_number);

  auto& metrics = observability::Metrics::Instance();
  metrics.SetOpenRequests("posted", stats.requests_posted());
  metrics.SetOpenRequests("claimed", stats.requests_claimed());
  metrics.SetOpenRequests("included", stats.requests_included());
  return stats;
}

std::vector<db::model::EventRecord> BridgeBoard::ReadEvents(uint64_t from_offset, std::optional<uint64_t> max_events) {
  return Atomic([&] { return ledger_.Events(from_offset, max_events); });
}

} // namespace bridge::core
