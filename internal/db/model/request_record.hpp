#pragma once

#include <cstdint>
#include <string>

#include "internal/util/amount.hpp"
#include "internal/util/bytes.hpp"

namespace bridge::db::model {

/*
  Persistent data request row.

  IMPORTANT:
  - This is the authoritative lifecycle record; the state is derived from it.
  - inclusion_proof_hash and result are write-once.
  - inclusion_reward + tally_reward + block_reward == deposited - paid_out.
*/

struct RequestRecord {
  uint64_t id = 0; // 0 until assigned by InsertRequest

  std::string   payload_ref;
  util::Hash256 payload_hash{};

  util::Amount inclusion_reward = 0;
  util::Amount tally_reward     = 0;
  util::Amount block_reward     = 0;

  util::Amount gas_price = 0;
  uint64_t     epoch     = 0;

  util::Hash256 inclusion_proof_hash{};
  util::Bytes   result;

  util::Address claimant{};
  uint64_t      claim_block = 0;

  util::Address requestor{};

  // Cumulative accounting, never decreases.
  util::Amount deposited = 0;
  util::Amount paid_out  = 0;

  uint64_t created_block = 0;
};

} // namespace bridge::db::model
