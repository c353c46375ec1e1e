#pragma once

#include <cstdint>

namespace bridge::core {

struct BoardParams {
  // A claim lapses once more than this many host blocks passed.
  uint64_t claim_expiry_blocks = 13;

  // Target number of reporters selected per beacon.
  uint64_t replication_factor = 2;
};

} // namespace bridge::core
