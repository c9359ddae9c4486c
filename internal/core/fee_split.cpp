#include "internal/core/fee_split.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace agentpay::core {

FeeSplit SplitFee(uint64_t amount, uint32_t basis_points) {
  if (basis_points > kMaxFeeBasisPoints) {
    throw util::FeeTooHighError("fee of " + std::to_string(basis_points) + " bps exceeds the " + std::to_string(kMaxFeeBasisPoints) +
                                " bps cap");
  }

  // amount = q * 10000 + r, so amount * bps / 10000 = q * bps + r * bps / 10000 exactly
  const uint64_t q = amount / kBasisPointsDenominator;
  const uint64_t r = amount % kBasisPointsDenominator;

  FeeSplit split;
  split.fee = q * basis_points + (r * basis_points) / kBasisPointsDenominator;
  split.net = amount - split.fee;
  return split;
}

} // namespace agentpay::core
