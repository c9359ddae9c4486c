#pragma once

#include <cstdint>
#include <string>

namespace agentpay::db::model {

struct RevenueBalanceRecord {
  std::string beneficiary;
  uint64_t    balance = 0;
};

} // namespace agentpay::db::model
