#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bridge::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRequest(Transaction&, model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t id) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&) override;
  uint64_t CountRequests(Transaction&) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&) override;

  std::optional<model::PaidBlockRecord> GetPaidBlock(Transaction&, const util::Hash256& block_hash) override;
  Result InsertPaidBlock(Transaction&, const model::PaidBlockRecord&) override;

  Result CreditBalance(Transaction&, const util::Address& address, util::Amount amount) override;
  util::Amount GetBalance(Transaction&, const util::Address& address) override;
  std::vector<model::BalanceRecord> ListBalances(Transaction&) override;

  Result AppendEvents(Transaction&, std::vector<model::EventRecord>& events) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_offset,
                                             std::optional<uint64_t> max_events) override;

private:
  friend class MemoryTransaction;

  struct State {
    // Arena indexed by id - 1.
    std::vector<model::RequestRecord> requests;

    std::map<util::Hash256, model::PaidBlockRecord> paid_blocks;
    std::map<util::Address, util::Amount> balances;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;

  // Append-only, so transactions snapshot its length instead of its contents.
  std::vector<model::EventRecord> events_;
};

}
