#include "internal/core/gas_estimator.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "support/board_harness.hpp"

namespace {

using bridge::core::GasCosts;
using bridge::core::GasEstimator;
using bridge::core::RewardPools;
using bridge::testing::Throws;
using bridge::util::ValidationError;

void TestEstimateMultipliesDefaultCosts() {
  GasEstimator estimator;
  const auto   minimums = estimator.Estimate(3);
  assert(minimums.inclusion == 3 * (187000 + 197000));
  assert(minimums.tally == 3 * 137000);
  assert(minimums.block == 3 * 2 * 97000);
}

void TestZeroPriceHasNoMinimums() {
  GasEstimator estimator;
  const auto   minimums = estimator.Estimate(0);
  assert(minimums.inclusion == 0 && minimums.tally == 0 && minimums.block == 0);
  estimator.RequireSufficient(RewardPools{}, 0);
}

void TestCustomCostsAreUsed() {
  GasEstimator estimator(GasCosts{10, 20, 30, 40});
  const auto   minimums = estimator.Estimate(2);
  assert(minimums.inclusion == 60);
  assert(minimums.tally == 60);
  assert(minimums.block == 160);
}

void TestRequireSufficientNamesTheShortPool() {
  GasEstimator estimator;
  const auto   minimums = estimator.Estimate(1);

  RewardPools pools{minimums.inclusion, minimums.tally, minimums.block};
  estimator.RequireSufficient(pools, 1);

  pools.inclusion -= 1;
  assert(Throws<ValidationError>([&] { estimator.RequireSufficient(pools, 1); }, "inclusion"));
  pools.inclusion += 1;

  pools.tally -= 1;
  assert(Throws<ValidationError>([&] { estimator.RequireSufficient(pools, 1); }, "tally"));
  pools.tally += 1;

  pools.block -= 1;
  assert(Throws<ValidationError>([&] { estimator.RequireSufficient(pools, 1); }, "block"));
}

void TestInclusionPaidOnlyOwesTallyAndHalfBlock() {
  GasEstimator estimator;
  const auto   minimums = estimator.Estimate(1);

  RewardPools pools{0, minimums.tally, minimums.block / 2};
  estimator.RequireSufficient(pools, 1, true);
  assert(Throws<ValidationError>([&] { estimator.RequireSufficient(pools, 1, false); }, "inclusion"));
}

void TestHugePriceOverflowIsRejected() {
  GasEstimator estimator;
  assert(Throws<ValidationError>([&] { (void)estimator.Estimate(std::numeric_limits<uint64_t>::max() / 1000); }, "overflow"));
}

} // namespace

int main() {
  TestEstimateMultipliesDefaultCosts();
  TestZeroPriceHasNoMinimums();
  TestCustomCostsAreUsed();
  TestRequireSufficientNamesTheShortPool();
  TestInclusionPaidOnlyOwesTallyAndHalfBlock();
  TestHugePriceOverflowIsRejected();

  std::cout << "bridge_unit_gas_estimator: pass\n";
  return 0;
}
