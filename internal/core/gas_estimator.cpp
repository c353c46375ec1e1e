#include "gas_estimator.hpp"

#include "internal/util/errors.hpp"

namespace bridge::core {

MinimumRewards GasEstimator::Estimate(util::Amount gas_price) const {
  MinimumRewards out;
  out.inclusion = util::CheckedMul(gas_price, util::CheckedAdd(costs_.claim, costs_.inclusion));
  out.tally     = util::CheckedMul(gas_price, costs_.result);
  out.block     = util::CheckedMul(gas_price, util::CheckedMul(2, costs_.block));
  return out;
}

void GasEstimator::RequireSufficient(const RewardPools& pools, util::Amount gas_price, bool inclusion_paid) const {
  auto minimum = Estimate(gas_price);
  if (inclusion_paid) {
    minimum.inclusion = 0;
    minimum.block /= 2;
  }
  if (pools.inclusion < minimum.inclusion) {
    throw util::ValidationError("inclusion reward too low for gas price");
  }
  if (pools.tally < minimum.tally) {
    throw util::ValidationError("tally reward too low for gas price");
  }
  if (pools.block < minimum.block) {
    throw util::ValidationError("block reward too low for gas price");
  }
}

} // namespace bridge::core
