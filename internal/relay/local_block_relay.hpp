#pragma once

#include <map>
#include <mutex>
#include <optional>

#include "internal/collab/block_relay.hpp"

namespace bridge::relay {

/*
  In-process block relay fed by PostBlock.

  Each posted block carries the Merkle roots of the requests and of the
  tallies it contains. Epochs must strictly increase; the latest block
  seeds the VRF beacon.
*/
class LocalBlockRelay final : public collab::BlockRelay {
 public:
  struct Block {
    util::Address relayer{};
    uint64_t      epoch = 0;
    util::Hash256 request_root{};
    util::Hash256 tally_root{};
  };

  void PostBlock(const util::Address& relayer, const util::Hash256& block_hash, uint64_t epoch, const util::Hash256& request_root,
                 const util::Hash256& tally_root);

  std::optional<Block> Find(const util::Hash256& block_hash) const;

  // Folds a Merkle path: bit i of index selects whether the node is the
  // left (0) or right (1) child at level i.
  static util::Hash256 FoldPath(const util::Hash256& leaf, const std::vector<util::Hash256>& proof, uint64_t index);

  uint64_t    CurrentEpoch() override;
  util::Bytes CurrentBeacon() override;

  bool VerifyInclusionProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch, uint64_t index,
                            const util::Hash256& payload_hash) override;

  bool VerifyResultProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch, uint64_t index,
                         const util::Hash256& result_hash) override;

  util::Address RelayerOfRecord(const util::Hash256& block_hash, uint64_t epoch) override;

 private:
  std::optional<Block> FindAt(const util::Hash256& block_hash, uint64_t epoch) const;

  mutable std::mutex                mutex_;
  std::map<util::Hash256, Block>    blocks_;
  std::optional<util::Hash256>      latest_;
  uint64_t                          latest_epoch_ = 0;
};

} // namespace bridge::relay
