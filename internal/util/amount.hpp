#pragma once

#include <cstdint>
#include <limits>

#include "internal/util/errors.hpp"

namespace bridge::util {

// Count of base value units.
using Amount = std::uint64_t;

inline Amount CheckedAdd(Amount a, Amount b) {
  if (a > std::numeric_limits<Amount>::max() - b) {
    throw ValidationError("amount overflow");
  }
  return a + b;
}

inline Amount CheckedMul(Amount a, Amount b) {
  if (a != 0 && b > std::numeric_limits<Amount>::max() / a) {
    throw ValidationError("amount overflow");
  }
  return a * b;
}

inline Amount CheckedSub(Amount a, Amount b) {
  if (b > a) {
    throw ValidationError("amount underflow");
  }
  return a - b;
}

} // namespace bridge::util
