#include "ram_payload_store.hpp"

#include <arrow/memory_pool.h>

#include <cstring>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace bridge::payload {

std::shared_ptr<arrow::Buffer> RamPayloadStore::Copy(const util::Bytes& bytes) {
  auto result = arrow::AllocateBuffer(static_cast<int64_t>(bytes.size()));
  if (!result.ok()) throw std::runtime_error(result.status().ToString());

  std::shared_ptr<arrow::Buffer> buf = std::move(*result);
  if (!bytes.empty()) {
    std::memcpy(buf->mutable_data(), bytes.data(), bytes.size());
  }
  return buf;
}

std::string RamPayloadStore::Put(const util::Bytes& bytes) {
  auto buf = Copy(bytes);
  auto ref = util::ToString(util::GenerateUUID());

  std::unique_lock lock(mutex_);
  buffers_[ref] = std::move(buf);
  return ref;
}

void RamPayloadStore::Replace(const std::string& payload_ref, const util::Bytes& bytes) {
  auto buf = Copy(bytes);

  std::unique_lock lock(mutex_);
  auto it = buffers_.find(payload_ref);
  if (it == buffers_.end()) throw util::ValidationError("unknown payload reference");
  it->second = std::move(buf);
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamPayloadStore::Read(const std::string& payload_ref) const {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(payload_ref);
  if (it == buffers_.end()) throw util::ValidationError("unknown payload reference");

  return it->second;
}

void RamPayloadStore::Remove(const std::string& payload_ref) {
  std::unique_lock lock(mutex_);
  buffers_.erase(payload_ref);
}

util::Bytes RamPayloadStore::PayloadBytes(const std::string& payload_ref) {
  const auto buf = Read(payload_ref);
  return util::Bytes(buf->data(), buf->data() + buf->size());
}

} // namespace bridge::payload
