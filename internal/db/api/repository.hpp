#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/paid_block_record.hpp"
#include "internal/db/model/request_record.hpp"

namespace bridge::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Request ids are dense and assigned in insertion order starting at 1
  - Event offsets are contiguous starting at 0

  The DB is the source of truth for:
    request records
    the paid-block set
    balances
    the event stream
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Data requests
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertRequest(Transaction&, model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t id) = 0;

  virtual Result UpdateRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual uint64_t CountRequests(Transaction&) = 0;

  virtual std::vector<model::RequestRecord> ListRequests(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Paid-block set
  // ---------------------------------------------------------------------

  virtual std::optional<model::PaidBlockRecord> GetPaidBlock(Transaction&, const util::Hash256& block_hash) = 0;

  virtual Result InsertPaidBlock(Transaction&, const model::PaidBlockRecord&) = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  virtual Result CreditBalance(Transaction&, const util::Address& address, util::Amount amount) = 0;

  virtual util::Amount GetBalance(Transaction&, const util::Address& address) = 0;

  virtual std::vector<model::BalanceRecord> ListBalances(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Appends entries while assigning contiguous offsets.
  virtual Result AppendEvents(Transaction&, std::vector<model::EventRecord>& events) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t start_offset, std::optional<uint64_t> max_events) = 0;
};

} // namespace bridge::db
