#pragma once

#include <cstdint>

#include "internal/util/amount.hpp"
#include "internal/util/bytes.hpp"

namespace bridge::host {

// Attributes the host attaches to every mutating call.
struct CallContext {
  util::Address caller{};
  util::Amount  value        = 0;
  util::Amount  gas_price    = 0;
  uint64_t      block_number = 0;
};

} // namespace bridge::host
