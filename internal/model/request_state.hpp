#pragma once

#include <cstdint>

#include "bridge/v1/types.pb.h"
#include "internal/db/model/request_record.hpp"
#include "internal/util/bytes.hpp"

namespace bridge::model {

/*
  Lifecycle is derived from the record, never stored:

    Posted -> Claimed -> Included -> Resulted
    Claimed -> Posted once the claim expires without an inclusion report
*/

inline bool ClaimExpired(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks) {
  return block_number >= record.claim_block && block_number - record.claim_block > expiry_blocks;
}

inline bool IsIncluded(const db::model::RequestRecord& record) {
  return !util::IsZero(record.inclusion_proof_hash);
}

inline bool HasResult(const db::model::RequestRecord& record) {
  return !record.result.empty();
}

// Never included or resulted, and either unclaimed or the claim lapsed.
inline bool IsClaimable(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks) {
  if (IsIncluded(record) || HasResult(record)) {
    return false;
  }
  return util::IsZero(record.claimant) || ClaimExpired(record, block_number, expiry_blocks);
}

inline bridge::v1::RequestState DeriveState(const db::model::RequestRecord& record, uint64_t block_number, uint64_t expiry_blocks) {
  if (HasResult(record)) return bridge::v1::REQUEST_STATE_RESULTED;
  if (IsIncluded(record)) return bridge::v1::REQUEST_STATE_INCLUDED;
  if (!IsClaimable(record, block_number, expiry_blocks)) return bridge::v1::REQUEST_STATE_CLAIMED;
  return bridge::v1::REQUEST_STATE_POSTED;
}

} // namespace bridge::model
