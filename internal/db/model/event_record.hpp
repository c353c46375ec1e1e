#pragma once

#include <cstdint>

#include "bridge/v1/types.pb.h"
#include "internal/util/amount.hpp"
#include "internal/util/bytes.hpp"

namespace bridge::db::model {

/*
  Entry of the offset-ordered event stream.

  `address` is the requestor, claimant, reporter or beneficiary depending on kind.
*/
struct EventRecord {
  uint64_t              offset     = 0; // assigned by AppendEvents
  bridge::v1::EventKind kind       = bridge::v1::EVENT_KIND_UNSPECIFIED;
  uint64_t              request_id = 0;
  util::Address         address{};
  util::Amount          amount = 0;
  bridge::v1::PayoutKind payout = bridge::v1::PAYOUT_KIND_UNSPECIFIED;
  uint64_t              block  = 0;
};

} // namespace bridge::db::model
