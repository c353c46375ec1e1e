#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/collab/payload_source.hpp"

namespace bridge::payload {

/*
  In-memory payload store.

  Backed by immutable Arrow buffers keyed by a UUID payload reference.
  Replace swaps the buffer behind an existing reference; requests posted
  against it notice on their next payload read.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamPayloadStore final : public collab::PayloadSource {
public:
  RamPayloadStore() = default;
  ~RamPayloadStore() override = default;

  // Copies the bytes and returns a fresh payload reference.
  std::string Put(const util::Bytes& bytes);

  void Replace(const std::string& payload_ref, const util::Bytes& bytes);

  std::shared_ptr<arrow::Buffer> Read(const std::string& payload_ref) const;

  void Remove(const std::string& payload_ref);

  // PayloadSource
  util::Bytes PayloadBytes(const std::string& payload_ref) override;

private:
  static std::shared_ptr<arrow::Buffer> Copy(const util::Bytes& bytes);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace bridge::payload
