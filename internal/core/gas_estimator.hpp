#pragma once

#include <cstdint>

#include "internal/util/amount.hpp"

namespace bridge::core {

// Worst-case gas units of each reporter operation.
struct GasCosts {
  uint64_t claim     = 187000;
  uint64_t inclusion = 197000;
  uint64_t result    = 137000;
  uint64_t block     = 97000;
};

struct MinimumRewards {
  util::Amount inclusion = 0;
  util::Amount tally     = 0;
  util::Amount block     = 0;
};

struct RewardPools {
  util::Amount inclusion = 0;
  util::Amount tally     = 0;
  util::Amount block     = 0;
};

class GasEstimator {
 public:
  GasEstimator() = default;
  explicit GasEstimator(GasCosts costs) : costs_(costs) {
  }

  /*
    minInclusion = price * (claim + inclusion)
    minTally     = price * result
    minBlock     = price * 2 * block
  */
  MinimumRewards Estimate(util::Amount gas_price) const;

  // Throws ValidationError naming the first pool below its minimum. Once
  // inclusion was paid only the tally pool and the unpaid half of the block
  // pool are still owed.
  void RequireSufficient(const RewardPools& pools, util::Amount gas_price, bool inclusion_paid = false) const;

  const GasCosts& Costs() const {
    return costs_;
  }

 private:
  GasCosts costs_;
};

} // namespace bridge::core
