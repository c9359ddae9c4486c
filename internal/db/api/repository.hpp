#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/consumed_payment_record.hpp"
#include "internal/db/model/entitlement_record.hpp"
#include "internal/db/model/fee_config_record.hpp"
#include "internal/db/model/revenue_balance_record.hpp"
#include "internal/db/model/settlement_event_record.hpp"

namespace agentpay::db {

/*
  Repository abstraction over the settlement ledgers.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A payment id can be inserted into consumed_payments at most once
  - Event sequences are assigned densely and never reused

  The DB is the source of truth for:
    consumed payment ids
    entitlements
    revenue balances
    fee configuration
    the settlement event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Replay protection
  // ---------------------------------------------------------------------

  virtual bool IsPaymentConsumed(Transaction&, const std::string& payment_id) = 0;

  // AlreadyExists when the id was consumed before
  virtual Result InsertConsumedPayment(Transaction&, const model::ConsumedPaymentRecord&) = 0;

  virtual uint64_t CountConsumedPayments(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Entitlements
  // ---------------------------------------------------------------------

  virtual std::optional<model::EntitlementRecord> GetEntitlement(Transaction&, uint64_t agent_id, const std::string& payer) = 0;

  virtual Result UpsertEntitlement(Transaction&, const model::EntitlementRecord&) = 0;

  virtual uint64_t CountEntitlements(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Revenue
  // ---------------------------------------------------------------------

  virtual std::optional<model::RevenueBalanceRecord> GetRevenueBalance(Transaction&, const std::string& beneficiary) = 0;

  virtual Result UpsertRevenueBalance(Transaction&, const model::RevenueBalanceRecord&) = 0;

  virtual std::vector<model::RevenueBalanceRecord> ListRevenueBalances(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Fee configuration (singleton row)
  // ---------------------------------------------------------------------

  virtual std::optional<model::FeeConfigRecord> GetFeeConfig(Transaction&) = 0;

  virtual Result PutFeeConfig(Transaction&, const model::FeeConfigRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns record.sequence
  virtual Result AppendEvent(Transaction&, model::SettlementEventRecord& record) = 0;

  virtual std::vector<model::SettlementEventRecord> ReadEvents(Transaction&, uint64_t after_sequence, uint64_t max_events) = 0;

  virtual uint64_t LastEventSequence(Transaction&) = 0;
};

} // namespace agentpay::db
