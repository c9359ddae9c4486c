#pragma once

#include <cstdint>

namespace agentpay::core {

inline constexpr uint32_t kMaxFeeBasisPoints      = 2000;
inline constexpr uint32_t kBasisPointsDenominator = 10000;

struct FeeSplit {
  uint64_t fee = 0;
  uint64_t net = 0;
};

// fee = floor(amount * basis_points / 10000), net = amount - fee, computed
// without overflowing 64 bits. Throws FeeTooHighError above the cap.
FeeSplit SplitFee(uint64_t amount, uint32_t basis_points);

} // namespace agentpay::core
