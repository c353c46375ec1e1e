#pragma once

#include "internal/util/amount.hpp"
#include "internal/util/bytes.hpp"

namespace bridge::db::model {

struct BalanceRecord {
  util::Address address{};
  util::Amount  amount = 0;
};

} // namespace bridge::db::model
