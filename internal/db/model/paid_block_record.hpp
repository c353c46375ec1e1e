#pragma once

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace bridge::db::model {

// External block already credited to its relayer.
struct PaidBlockRecord {
  util::Hash256 block_hash{};
  uint64_t      first_request = 0;
  util::Address relayer{};
  uint64_t      epoch = 0;
};

} // namespace bridge::db::model
