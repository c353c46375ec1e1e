#pragma once

#include <cstdint>
#include <vector>

#include "internal/util/bytes.hpp"

namespace bridge::collab {

/*
  External-network block relay.

  Supplies epochs, the VRF beacon and Merkle proof verification. The board
  treats it as semi-trusted: it may call back into the board while a
  verification is in flight.
*/
class BlockRelay {
 public:
  virtual ~BlockRelay() = default;

  virtual uint64_t    CurrentEpoch()  = 0;
  virtual util::Bytes CurrentBeacon() = 0;

  virtual bool VerifyInclusionProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch,
                                    uint64_t index, const util::Hash256& payload_hash) = 0;

  virtual bool VerifyResultProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch,
                                 uint64_t index, const util::Hash256& result_hash) = 0;

  // Zero address when the block is unknown.
  virtual util::Address RelayerOfRecord(const util::Hash256& block_hash, uint64_t epoch) = 0;
};

} // namespace bridge::collab
