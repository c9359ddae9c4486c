#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "agentpay/settlement/v1/types.pb.h"
#include "internal/auth/access_policy.hpp"
#include "internal/core/fee_split.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/ledger/entitlement_ledger.hpp"
#include "internal/ledger/replay_guard.hpp"
#include "internal/ledger/revenue_ledger.hpp"
#include "internal/registry/ownership_registry.hpp"
#include "internal/registry/sku_catalog.hpp"
#include "internal/token/token_authorization.hpp"
#include "internal/util/time.hpp"

namespace agentpay::core {

struct EngineConfig {
  // receives pulled funds, pays out withdrawals
  std::string settlement_address;
  // the only pricing token accepted
  std::string token_address;

  // seeded into the repository only when no fee config is stored yet
  uint32_t    initial_fee_basis_points = 0;
  std::string initial_treasury;
};

struct SettlementResult {
  std::string                  payment_id;
  db::model::EntitlementRecord entitlement;
  std::string                  beneficiary;
  uint64_t                     fee = 0;
  uint64_t                     net = 0;
};

struct EngineStats {
  uint64_t consumed_payments   = 0;
  uint64_t entitlement_records = 0;
  uint64_t beneficiaries       = 0;
  uint64_t outstanding_revenue = 0;
  uint64_t last_event_sequence = 0;
};

/*
  SettlementEngine

  Owns every ledger mutation: settlement, metering, withdrawal and fee
  administration. Mutations run one at a time under a single writer lock;
  reads use repository snapshots and never take it.

  Settle order:
    1. replay check                         ReplayError
    2. burn payment id (committed alone)
    3. SKU validation                       Inactive/SkuMismatch/WrongToken/AmountMismatch/InvalidPayer
    4. resolve owner                        NotFound
    5. pull funds                           FundsPullError
    6. entitlement + fee split + revenue    one transaction
    7. publish events

  A failure after step 2 leaves the payment id burned.
*/
class SettlementEngine {
 public:
  SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const registry::OwnershipRegistry> ownership,
                   std::shared_ptr<const registry::SkuCatalog> skus, std::shared_ptr<token::TokenAuthorization> token,
                   std::shared_ptr<const auth::AccessPolicy> access, std::shared_ptr<events::EventSink> events,
                   std::shared_ptr<const util::Clock> clock, EngineConfig config);

  // Persists the initial fee config if none is stored.
  void Bootstrap();

  SettlementResult Settle(const auth::Principal& caller, const agentpay::settlement::v1::PaymentReceipt& receipt,
                          const agentpay::settlement::v1::AuthorizationProof& proof);

  bool                         HasAccess(uint64_t agent_id, const std::string& payer) const;
  db::model::EntitlementRecord GetEntitlement(uint64_t agent_id, const std::string& payer) const;

  db::model::EntitlementRecord ConsumeCall(const auth::Principal& caller, uint64_t agent_id, const std::string& payer);

  // Debits the caller's own balance and sends the funds to `to`.
  // Returns the remaining balance.
  uint64_t Withdraw(const auth::Principal& caller, const std::string& to, uint64_t amount);

  uint64_t BalanceOf(const std::string& beneficiary) const;

  db::model::FeeConfigRecord SetFeeBasisPoints(const auth::Principal& caller, uint32_t fee_basis_points);
  db::model::FeeConfigRecord SetTreasury(const auth::Principal& caller, const std::string& treasury);
  db::model::FeeConfigRecord GetFeeConfig() const;

  EngineStats Stats() const;

  // max_events == 0 reads to the end of the log
  std::vector<agentpay::settlement::v1::SettlementEvent> ListEvents(uint64_t after_sequence, uint64_t max_events) const;

  const EngineConfig& config() const {
    return config_;
  }

 private:
  SettlementResult SettleLocked(const agentpay::settlement::v1::PaymentReceipt& receipt,
                                const agentpay::settlement::v1::AuthorizationProof& proof);

  db::model::FeeConfigRecord LoadFeeConfig(db::Transaction& tx) const;
  void                       Publish(const agentpay::settlement::v1::SettlementEvent& event);

  std::shared_ptr<db::Repository>                    repository_;
  std::shared_ptr<const registry::OwnershipRegistry> ownership_;
  std::shared_ptr<const registry::SkuCatalog>        skus_;
  std::shared_ptr<token::TokenAuthorization>         token_;
  std::shared_ptr<const auth::AccessPolicy>          access_;
  std::shared_ptr<events::EventSink>                 events_;
  std::shared_ptr<const util::Clock>                 clock_;
  EngineConfig                                       config_;

  ledger::ReplayGuard       replay_guard_;
  ledger::EntitlementLedger entitlements_;
  ledger::RevenueLedger     revenue_;

  std::mutex write_mutex_;
};

} // namespace agentpay::core
