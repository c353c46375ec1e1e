#pragma once

#include "internal/core/gas_estimator.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/util/amount.hpp"

namespace bridge::core {

/*
  Bookkeeping of the three reward pools embedded in a request record.

  Invariant kept by every mutation:
    inclusion + tally + block + paid_out == deposited
*/
class RewardLedger {
 public:
  explicit RewardLedger(db::model::RequestRecord& record) : record_(record) {
  }

  RewardPools Pools() const;

  // value beyond add_inclusion + add_tally lands in the block pool.
  void Deposit(util::Amount add_inclusion, util::Amount add_tally, util::Amount value);

  // Each Take* drains (part of) a pool and books it as paid out.
  util::Amount TakeInclusion();
  util::Amount TakeTally();
  util::Amount TakeBlockHalf();
  util::Amount TakeBlockRemainder();

  util::Amount Outstanding() const;
  bool         Balanced() const;

 private:
  util::Amount Take(util::Amount& pool, util::Amount amount);

  db::model::RequestRecord& record_;
};

} // namespace bridge::core
