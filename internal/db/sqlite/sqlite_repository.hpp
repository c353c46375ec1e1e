#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bridge::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
