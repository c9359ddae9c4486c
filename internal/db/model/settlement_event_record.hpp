#pragma once

#include <cstdint>
#include <string>

#include "agentpay/settlement/v1/types.pb.h"

namespace agentpay::db::model {

/*
  Append-only log row. Fields not relevant to a kind stay empty/zero.
*/

struct SettlementEventRecord {
  uint64_t sequence = 0;

  agentpay::settlement::v1::SettlementEventKind kind = agentpay::settlement::v1::SETTLEMENT_EVENT_KIND_UNSPECIFIED;

  // unix seconds
  uint64_t occurred_at = 0;

  std::string payment_id;
  uint64_t    agent_id = 0;
  uint64_t    sku_id   = 0;
  std::string payer;
  std::string beneficiary;
  std::string treasury;

  uint64_t amount       = 0;
  uint64_t fee          = 0;
  uint64_t net          = 0;
  uint64_t call_credits = 0;
  uint64_t valid_until  = 0;

  std::string detail;
};

} // namespace agentpay::db::model
