#include "sortition.hpp"

#include <limits>
#include <stdexcept>

namespace bridge::core {

uint256 OutputToUint256(const util::Bytes& vrf_output) {
  if (vrf_output.size() < 32) {
    throw std::invalid_argument("vrf output shorter than 32 bytes");
  }
  uint256 value = 0;
  for (std::size_t i = 0; i < 32; ++i) {
    value <<= 8;
    value |= vrf_output[i];
  }
  return value;
}

bool SortitionAccepts(const uint256& output, uint64_t active_count, uint64_t replication_factor) {
  if (active_count == 0 || active_count < replication_factor) {
    return true;
  }
  const uint256 max = std::numeric_limits<uint256>::max();
  // (max / active) * replication cannot overflow since replication <= active.
  const uint256 threshold = (max / active_count) * replication_factor;
  return output <= threshold;
}

} // namespace bridge::core
