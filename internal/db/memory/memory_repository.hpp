#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace agentpay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  bool     IsPaymentConsumed(Transaction&, const std::string& payment_id) override;
  Result   InsertConsumedPayment(Transaction&, const model::ConsumedPaymentRecord&) override;
  uint64_t CountConsumedPayments(Transaction&) override;

  std::optional<model::EntitlementRecord> GetEntitlement(Transaction&, uint64_t agent_id, const std::string& payer) override;
  Result                                  UpsertEntitlement(Transaction&, const model::EntitlementRecord&) override;
  uint64_t                                CountEntitlements(Transaction&) override;

  std::optional<model::RevenueBalanceRecord> GetRevenueBalance(Transaction&, const std::string& beneficiary) override;
  Result                                     UpsertRevenueBalance(Transaction&, const model::RevenueBalanceRecord&) override;
  std::vector<model::RevenueBalanceRecord>   ListRevenueBalances(Transaction&) override;

  std::optional<model::FeeConfigRecord> GetFeeConfig(Transaction&) override;
  Result                                PutFeeConfig(Transaction&, const model::FeeConfigRecord&) override;

  Result                                     AppendEvent(Transaction&, model::SettlementEventRecord& record) override;
  std::vector<model::SettlementEventRecord> ReadEvents(Transaction&, uint64_t after_sequence, uint64_t max_events) override;
  uint64_t                                   LastEventSequence(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ConsumedPaymentRecord> consumed_payments;
    std::unordered_map<std::string, model::EntitlementRecord>     entitlements;
    std::map<std::string, uint64_t>                               revenue_balances;
    std::optional<model::FeeConfigRecord>                         fee_config;
    std::vector<model::SettlementEventRecord>                     events;
  };

  // Published states are immutable; a transaction pins the one it began on.
  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

} // namespace agentpay::db::memory
