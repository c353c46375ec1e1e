#pragma once

#include <cstdint>
#include <vector>

#include "internal/collab/block_relay.hpp"
#include "internal/collab/reporter_population.hpp"
#include "internal/core/board_params.hpp"
#include "internal/core/ledger.hpp"
#include "internal/host/call_context.hpp"

namespace bridge::core {

struct InclusionReport {
  uint64_t                   id = 0;
  std::vector<util::Hash256> proof;
  uint64_t                   index = 0;
  util::Hash256              block_hash{};
  uint64_t                   epoch = 0;
};

struct ResultReport {
  uint64_t                   id = 0;
  std::vector<util::Hash256> proof;
  uint64_t                   index = 0;
  util::Hash256              block_hash{};
  uint64_t                   epoch = 0;
  util::Bytes                result;
};

/*
  Proof-driven settlement of claimed requests.

  Both reports follow checks -> effects -> relay verification -> transfers:
  the write-once fields and the epoch are stored before the relay is
  consulted, and value moves last.
*/
class Settlement {
 public:
  Settlement(Ledger& ledger, collab::BlockRelay& relay, collab::ReporterPopulation& population, BoardParams params);

  // Returns the stored inclusion proof hash.
  util::Hash256 ReportInclusion(const host::CallContext& ctx, const InclusionReport& report);

  void ReportResult(const host::CallContext& ctx, const ResultReport& report);

 private:
  // Pays one half of a block reward according to the paid-block set.
  void PayBlockShare(const db::model::RequestRecord& record, const util::Hash256& block_hash, uint64_t epoch, util::Amount amount,
                     uint64_t block_number);

  Ledger&                     ledger_;
  collab::BlockRelay&         relay_;
  collab::ReporterPopulation& population_;
  BoardParams                 params_;
};

} // namespace bridge::core
