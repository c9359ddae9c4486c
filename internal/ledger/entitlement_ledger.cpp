#include "internal/ledger/entitlement_ledger.hpp"

#include <algorithm>
#include <limits>

#include "internal/ledger/ledger_error.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::ledger {

EntitlementLedger::EntitlementLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::EntitlementRecord EntitlementLedger::Get(db::Transaction& tx, uint64_t agent_id, const std::string& payer) const {
  if (auto record = repository_->GetEntitlement(tx, agent_id, payer)) {
    return *record;
  }

  db::model::EntitlementRecord empty;
  empty.agent_id = agent_id;
  empty.payer    = payer;
  return empty;
}

db::model::EntitlementRecord EntitlementLedger::GrantCall(db::Transaction& tx, uint64_t agent_id, const std::string& payer) {
  auto record = Get(tx, agent_id, payer);
  if (record.call_credits == std::numeric_limits<uint64_t>::max()) {
    throw util::InvalidState("call credit counter overflow for agent " + std::to_string(agent_id));
  }
  record.call_credits += 1;
  Store(tx, record);
  return record;
}

db::model::EntitlementRecord EntitlementLedger::ExtendPeriod(db::Transaction& tx, uint64_t agent_id, const std::string& payer,
                                                             uint64_t period_seconds, uint64_t now) {
  auto           record = Get(tx, agent_id, payer);
  const uint64_t base   = std::max(record.valid_until, now);
  if (period_seconds > std::numeric_limits<uint64_t>::max() - base) {
    throw util::InvalidState("entitlement window overflow for agent " + std::to_string(agent_id));
  }
  record.valid_until = base + period_seconds;
  Store(tx, record);
  return record;
}

db::model::EntitlementRecord EntitlementLedger::ConsumeCall(db::Transaction& tx, uint64_t agent_id, const std::string& payer) {
  auto record = Get(tx, agent_id, payer);
  if (record.call_credits == 0) {
    throw util::NoCreditsError("no call credits left for payer " + payer + " on agent " + std::to_string(agent_id));
  }
  record.call_credits -= 1;
  Store(tx, record);
  return record;
}

uint64_t EntitlementLedger::Count(db::Transaction& tx) const {
  return repository_->CountEntitlements(tx);
}

bool EntitlementLedger::HasAccess(const db::model::EntitlementRecord& record, uint64_t now) {
  return record.call_credits > 0 || record.valid_until >= now;
}

void EntitlementLedger::Store(db::Transaction& tx, const db::model::EntitlementRecord& record) {
  ThrowIfFailed(repository_->UpsertEntitlement(tx, record), "store entitlement");
}

} // namespace agentpay::ledger
