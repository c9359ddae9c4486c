#pragma once

#include <cstdint>
#include <string>

namespace agentpay::db::model {

struct FeeConfigRecord {
  uint32_t    fee_basis_points = 0;
  std::string treasury;
};

} // namespace agentpay::db::model
