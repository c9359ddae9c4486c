#pragma once

#include <cstdint>
#include <string>

namespace agentpay::db::model {

/*
  Access rights of one payer to one agent.

  Rows are created on first grant and never deleted; a record with zero
  credits and an elapsed deadline simply grants nothing.
*/

struct EntitlementRecord {
  uint64_t    agent_id = 0;
  std::string payer;

  uint64_t call_credits = 0;

  // unix seconds, 0 = never granted
  uint64_t valid_until = 0;
};

} // namespace agentpay::db::model
