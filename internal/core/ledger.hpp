#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bridge::core {

/*
  Transactional view of the board state shared by every component.

  Every public board call runs inside a Scope:
  - calls are totally ordered by one board-wide lock
  - the outermost scope opens the repository transaction and commits it
  - a scope opened by a collaborator calling back into the board joins the
    in-flight transaction and sees every effect already written
  - a nested scope that exits without committing poisons the outer call,
    which then rolls back as a whole
  - AfterCommit hooks run only once the outermost commit succeeded
*/
class Ledger {
 public:
  explicit Ledger(std::shared_ptr<db::Repository> repository);

  class Scope {
   public:
    explicit Scope(Ledger& ledger);
    ~Scope();

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;

    void Commit();

   private:
    Ledger&                                ledger_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool                                   outermost_ = false;
    bool                                   committed_ = false;
  };

  // Throws ValidationError("bad handle") for 0 or an unissued id.
  db::model::RequestRecord Load(uint64_t id);
  uint64_t                 Insert(db::model::RequestRecord& record);
  void                     Store(const db::model::RequestRecord& record);
  uint64_t                 Count();
  std::vector<db::model::RequestRecord> All();

  std::optional<db::model::PaidBlockRecord> PaidBlock(const util::Hash256& block_hash);
  void                                      MarkPaid(const db::model::PaidBlockRecord& record);

  // Credits the beneficiary and records a payout event. Zero amounts are skipped.
  void         Credit(const util::Address& beneficiary, util::Amount amount, uint64_t request_id, bridge::v1::PayoutKind kind,
                      uint64_t block_number);
  util::Amount Balance(const util::Address& address);
  std::vector<db::model::BalanceRecord> Balances();

  void                            Emit(db::model::EventRecord event);
  std::vector<db::model::EventRecord> Events(uint64_t from_offset, std::optional<uint64_t> max_events);

  void AfterCommit(std::function<void()> hook);

 private:
  db::Transaction& Tx();
  void             Finish(bool outermost, bool committed);

  std::shared_ptr<db::Repository>    repository_;
  std::recursive_mutex               mutex_;
  std::unique_ptr<db::Transaction>   tx_;
  int                                depth_    = 0;
  bool                               poisoned_ = false;
  std::vector<std::function<void()>> after_commit_;
};

} // namespace bridge::core
