#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/core/fee_split.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::core::SplitFee;

void TestReferenceSplit() {
  const auto split = SplitFee(10'000'000, 250);
  assert(split.fee == 250'000);
  assert(split.net == 9'750'000);
}

void TestFeeRoundsDown() {
  auto split = SplitFee(1, 250);
  assert(split.fee == 0);
  assert(split.net == 1);

  split = SplitFee(10'399, 100);
  assert(split.fee == 103);
  assert(split.net == 10'296);

  split = SplitFee(0, 2000);
  assert(split.fee == 0);
  assert(split.net == 0);
}

void TestCapBoundary() {
  const auto split = SplitFee(10'000, 2000);
  assert(split.fee == 2'000);
  assert(split.net == 8'000);

  bool threw = false;
  try {
    (void)SplitFee(10'000, 2001);
  } catch (const agentpay::util::FeeTooHighError&) {
    threw = true;
  }
  assert(threw);
}

void TestNoOverflowAtMaxAmount() {
  const uint64_t max   = std::numeric_limits<uint64_t>::max();
  const auto     split = SplitFee(max, 2000);
  assert(split.fee == max / 5);
  assert(split.fee + split.net == max);

  const auto odd = SplitFee(max, 1);
  // floor((2^64 - 1) / 10000)
  assert(odd.fee == 1'844'674'407'370'955ULL);
  assert(odd.fee + odd.net == max);
}

} // namespace

int main() {
  TestReferenceSplit();
  TestFeeRoundsDown();
  TestCapBoundary();
  TestNoOverflowAtMaxAmount();

  std::cout << "agentpay_unit_fee_split: pass\n";
  return 0;
}
