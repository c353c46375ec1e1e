#include "local_block_relay.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace bridge::relay {

void LocalBlockRelay::PostBlock(const util::Address& relayer, const util::Hash256& block_hash, uint64_t epoch,
                                const util::Hash256& request_root, const util::Hash256& tally_root) {
  if (util::IsZero(relayer)) {
    throw util::ValidationError("relayer address is zero");
  }

  {
    std::lock_guard lock(mutex_);
    if (blocks_.contains(block_hash)) {
      throw util::StateError("block already posted");
    }
    if (latest_.has_value() && epoch <= latest_epoch_) {
      throw util::StateError("block epoch must increase");
    }
    blocks_[block_hash] = Block{relayer, epoch, request_root, tally_root};
    latest_             = block_hash;
    latest_epoch_       = epoch;
  }

  BRIDGE_LOG_INFO("posted block", {observability::HexField("block_hash", block_hash), observability::UintField("epoch", epoch),
                                   observability::HexField("relayer", relayer)});
}

std::optional<LocalBlockRelay::Block> LocalBlockRelay::Find(const util::Hash256& block_hash) const {
  std::lock_guard lock(mutex_);
  auto            it = blocks_.find(block_hash);
  if (it == blocks_.end()) return std::nullopt;
  return it->second;
}

std::optional<LocalBlockRelay::Block> LocalBlockRelay::FindAt(const util::Hash256& block_hash, uint64_t epoch) const {
  auto block = Find(block_hash);
  if (!block.has_value() || block->epoch != epoch) return std::nullopt;
  return block;
}

util::Hash256 LocalBlockRelay::FoldPath(const util::Hash256& leaf, const std::vector<util::Hash256>& proof, uint64_t index) {
  auto node = leaf;
  for (const auto& sibling : proof) {
    node = (index & 1) == 0 ? util::HashPair(node, sibling) : util::HashPair(sibling, node);
    index >>= 1;
  }
  return node;
}

uint64_t LocalBlockRelay::CurrentEpoch() {
  std::lock_guard lock(mutex_);
  return latest_epoch_;
}

util::Bytes LocalBlockRelay::CurrentBeacon() {
  std::lock_guard lock(mutex_);
  util::Bytes     beacon;
  if (latest_.has_value()) {
    beacon.assign(latest_->begin(), latest_->end());
  } else {
    beacon.assign(32, 0);
  }
  for (int shift = 56; shift >= 0; shift -= 8) {
    beacon.push_back(static_cast<uint8_t>(latest_epoch_ >> shift));
  }
  return beacon;
}

bool LocalBlockRelay::VerifyInclusionProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch,
                                           uint64_t index, const util::Hash256& payload_hash) {
  const auto block = FindAt(block_hash, epoch);
  return block.has_value() && FoldPath(payload_hash, proof, index) == block->request_root;
}

bool LocalBlockRelay::VerifyResultProof(const std::vector<util::Hash256>& proof, const util::Hash256& block_hash, uint64_t epoch,
                                        uint64_t index, const util::Hash256& result_hash) {
  const auto block = FindAt(block_hash, epoch);
  return block.has_value() && FoldPath(result_hash, proof, index) == block->tally_root;
}

util::Address LocalBlockRelay::RelayerOfRecord(const util::Hash256& block_hash, uint64_t epoch) {
  const auto block = FindAt(block_hash, epoch);
  return block.has_value() ? block->relayer : util::Address{};
}

} // namespace bridge::relay
