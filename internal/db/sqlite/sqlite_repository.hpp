#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace agentpay::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace agentpay::db::sqlite
