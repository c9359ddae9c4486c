#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace agentpay::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace agentpay::db::postgres
