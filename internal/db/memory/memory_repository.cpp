#include "memory_repository.hpp"

#include <algorithm>
#include <limits>

#include "memory_tx.hpp"

namespace bridge::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Data requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = static_cast<uint64_t>(s.requests.size()) + 1;
  s.requests.push_back(r);
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, uint64_t id) {
  const auto& s = TX(t).View();
  if (id == 0 || id > s.requests.size()) return std::nullopt;
  return s.requests[id - 1];
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0 || r.id > s.requests.size()) return Result::Err(ErrorCode::NotFound);
  s.requests[r.id - 1] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountRequests(Transaction& t) {
  return static_cast<uint64_t>(TX(t).View().requests.size());
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t) {
  return TX(t).View().requests;
}

// ------------------------------------------------------------------
// Paid-block set
// ------------------------------------------------------------------

std::optional<model::PaidBlockRecord> MemoryRepository::GetPaidBlock(Transaction& t, const util::Hash256& block_hash) {
  const auto& s  = TX(t).View();
  const auto  it = s.paid_blocks.find(block_hash);
  if (it == s.paid_blocks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertPaidBlock(Transaction& t, const model::PaidBlockRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.paid_blocks.contains(r.block_hash)) return Result::Err(ErrorCode::AlreadyExists);
  s.paid_blocks[r.block_hash] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Balances
// ------------------------------------------------------------------

Result MemoryRepository::CreditBalance(Transaction& t, const util::Address& address, util::Amount amount) {
  auto& balance = TX(t).Mutable().balances[address];
  if (balance > std::numeric_limits<util::Amount>::max() - amount) {
    return Result::Err(ErrorCode::ConstraintViolation, "balance overflow");
  }
  balance += amount;
  return Result::Ok();
}

util::Amount MemoryRepository::GetBalance(Transaction& t, const util::Address& address) {
  const auto& s  = TX(t).View();
  const auto  it = s.balances.find(address);
  return it == s.balances.end() ? 0 : it->second;
}

std::vector<model::BalanceRecord> MemoryRepository::ListBalances(Transaction& t) {
  std::vector<model::BalanceRecord> out;
  for (const auto& [address, amount] : TX(t).View().balances) {
    out.push_back({address, amount});
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvents(Transaction& t, std::vector<model::EventRecord>& events) {
  auto& tx      = TX(t);
  auto& pending = tx.PendingEvents();
  for (auto& event : events) {
    event.offset = tx.EventsBase() + static_cast<uint64_t>(pending.size());
    pending.push_back(event);
  }
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t start_offset,
                                                             std::optional<uint64_t> max_events) {
  auto&          tx      = TX(t);
  const auto     base    = tx.EventsBase();
  const auto&    pending = tx.PendingEvents();
  const uint64_t size    = base + static_cast<uint64_t>(pending.size());

  std::vector<model::EventRecord> out;
  if (start_offset >= size) {
    return out;
  }

  auto end = size;
  if (max_events.has_value() && *max_events < end - start_offset) {
    end = start_offset + *max_events;
  }
  out.reserve(static_cast<std::size_t>(end - start_offset));

  if (start_offset < base) {
    // Offsets below the snapshot length never change after commit.
    std::scoped_lock lock(mutex_);
    const auto       last = std::min(end, base);
    out.insert(out.end(), events_.begin() + static_cast<std::ptrdiff_t>(start_offset),
               events_.begin() + static_cast<std::ptrdiff_t>(last));
  }
  for (auto offset = std::max(start_offset, base); offset < end; ++offset) {
    out.push_back(pending[static_cast<std::size_t>(offset - base)]);
  }
  return out;
}

} // namespace bridge::db::memory
