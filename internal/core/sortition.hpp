#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>

#include "internal/util/bytes.hpp"

namespace bridge::core {

using uint256 = boost::multiprecision::uint256_t;

// Big-endian value of the first 32 bytes of a VRF output.
uint256 OutputToUint256(const util::Bytes& vrf_output);

/*
  Everyone is eligible while fewer than replication_factor reporters are
  active. Otherwise the output must fall in the lowest
  replication_factor / active_count fraction of the output space, computed
  as output <= (MAX / active_count) * replication_factor.
*/
bool SortitionAccepts(const uint256& output, uint64_t active_count, uint64_t replication_factor);

} // namespace bridge::core
