#pragma once

#include <cstdint>
#include <string>

namespace agentpay::db::model {

struct ConsumedPaymentRecord {
  std::string payment_id; // 0x + 64 lowercase hex
  std::string payer;
  uint64_t    agent_id    = 0;
  uint64_t    sku_id      = 0;
  uint64_t    amount      = 0;
  uint64_t    consumed_at = 0; // unix seconds
};

} // namespace agentpay::db::model
