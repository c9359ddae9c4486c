#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace agentpay::ledger {

/*
  EntitlementLedger

  Per (agent, payer) access rights. Missing rows read as an empty
  entitlement; grants create them and nothing deletes them.
*/
class EntitlementLedger {
 public:
  explicit EntitlementLedger(std::shared_ptr<db::Repository> repository);

  db::model::EntitlementRecord Get(db::Transaction& tx, uint64_t agent_id, const std::string& payer) const;

  // callCredits += 1, valid_until unchanged
  db::model::EntitlementRecord GrantCall(db::Transaction& tx, uint64_t agent_id, const std::string& payer);

  // valid_until = max(valid_until, now) + period_seconds
  db::model::EntitlementRecord ExtendPeriod(db::Transaction& tx, uint64_t agent_id, const std::string& payer, uint64_t period_seconds,
                                            uint64_t now);

  // Throws NoCreditsError without writing when no credit is left.
  db::model::EntitlementRecord ConsumeCall(db::Transaction& tx, uint64_t agent_id, const std::string& payer);

  uint64_t Count(db::Transaction& tx) const;

  static bool HasAccess(const db::model::EntitlementRecord& record, uint64_t now);

 private:
  void Store(db::Transaction& tx, const db::model::EntitlementRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace agentpay::ledger
