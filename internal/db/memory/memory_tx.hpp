#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace bridge::db::memory {

/*
  Transaction = snapshot + write set

  Commit fails with a conflict if another transaction committed after the
  snapshot was taken. Events are not copied: the snapshot keeps the committed
  log length and new events are buffered until commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  uint64_t EventsBase() const {
    return events_base_;
  }
  std::vector<model::EventRecord>& PendingEvents() {
    return pending_events_;
  }

 private:
  MemoryRepository&               repo_;
  MemoryRepository::State         working_;
  uint64_t                        events_base_ = 0;
  std::vector<model::EventRecord> pending_events_;
  uint64_t                        snapshot_version_ = 0;
  bool                            committed_        = false;
  bool                            rolled_back_      = false;
};

} // namespace bridge::db::memory
