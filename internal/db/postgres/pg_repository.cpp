#include "pg_repository.hpp"

#include <limits>

namespace agentpay::db::postgres {

namespace {

model::SettlementEventRecord ReadEventRow(const pqxx::row& row) {
  model::SettlementEventRecord r;
  r.sequence     = row[0].as<uint64_t>();
  r.kind         = static_cast<agentpay::settlement::v1::SettlementEventKind>(row[1].as<int>());
  r.occurred_at  = row[2].as<uint64_t>();
  r.payment_id   = row[3].c_str();
  r.agent_id     = row[4].as<uint64_t>();
  r.sku_id       = row[5].as<uint64_t>();
  r.payer        = row[6].c_str();
  r.beneficiary  = row[7].c_str();
  r.treasury     = row[8].c_str();
  r.amount       = row[9].as<uint64_t>();
  r.fee          = row[10].as<uint64_t>();
  r.net          = row[11].as<uint64_t>();
  r.call_credits = row[12].as<uint64_t>();
  r.valid_until  = row[13].as<uint64_t>();
  r.detail       = row[14].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool PgRepository::IsPaymentConsumed(Transaction& t, const std::string& payment_id) {
  return !TX(t).Work().exec_prepared("payment_consumed", payment_id).empty();
}

Result PgRepository::InsertConsumedPayment(Transaction& t, const model::ConsumedPaymentRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_consumed_payment", r.payment_id, r.payer, r.agent_id, r.sku_id, r.amount, r.consumed_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountConsumedPayments(Transaction& t) {
  return TX(t).Work().exec("SELECT COUNT(*) FROM consumed_payments;")[0][0].as<uint64_t>();
}

std::optional<model::EntitlementRecord> PgRepository::GetEntitlement(Transaction& t, uint64_t agent_id, const std::string& payer) {
  auto res = TX(t).Work().exec_prepared("get_entitlement", agent_id, payer);
  if (res.empty()) return std::nullopt;

  model::EntitlementRecord r;
  r.agent_id     = agent_id;
  r.payer        = payer;
  r.call_credits = res[0][0].as<uint64_t>();
  r.valid_until  = res[0][1].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_entitlement", r.agent_id, r.payer, r.call_credits, r.valid_until);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountEntitlements(Transaction& t) {
  return TX(t).Work().exec("SELECT COUNT(*) FROM entitlements;")[0][0].as<uint64_t>();
}

std::optional<model::RevenueBalanceRecord> PgRepository::GetRevenueBalance(Transaction& t, const std::string& beneficiary) {
  auto res = TX(t).Work().exec_prepared("get_revenue_balance", beneficiary);
  if (res.empty()) return std::nullopt;
  return model::RevenueBalanceRecord{beneficiary, res[0][0].as<uint64_t>()};
}

Result PgRepository::UpsertRevenueBalance(Transaction& t, const model::RevenueBalanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_revenue_balance", r.beneficiary, r.balance);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RevenueBalanceRecord> PgRepository::ListRevenueBalances(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT beneficiary,balance FROM revenue_balances ORDER BY beneficiary ASC;");

  std::vector<model::RevenueBalanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].c_str(), row[1].as<uint64_t>()});
  }
  return out;
}

std::optional<model::FeeConfigRecord> PgRepository::GetFeeConfig(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT fee_basis_points,treasury FROM fee_config WHERE id=1;");
  if (res.empty()) return std::nullopt;

  model::FeeConfigRecord r;
  r.fee_basis_points = res[0][0].as<uint32_t>();
  r.treasury         = res[0][1].c_str();
  return r;
}

Result PgRepository::PutFeeConfig(Transaction& t, const model::FeeConfigRecord& r) {
  try {
    TX(t).Work().exec_prepared("put_fee_config", r.fee_basis_points, r.treasury);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendEvent(Transaction& t, model::SettlementEventRecord& r) {
  try {
    // concurrent appenders collide on the primary key instead of sharing a sequence
    const uint64_t sequence = LastEventSequence(t) + 1;
    TX(t).Work().exec_prepared("append_event", sequence, static_cast<int>(r.kind), r.occurred_at, r.payment_id, r.agent_id, r.sku_id,
                               r.payer, r.beneficiary, r.treasury, r.amount, r.fee, r.net, r.call_credits, r.valid_until, r.detail);
    r.sequence = sequence;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SettlementEventRecord> PgRepository::ReadEvents(Transaction& t, uint64_t after_sequence, uint64_t max_events) {
  const auto limit = max_events == 0 ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) : max_events;
  auto       res   = TX(t).Work().exec_prepared("read_events", after_sequence, limit);

  std::vector<model::SettlementEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEventRow(row));
  }
  return out;
}

uint64_t PgRepository::LastEventSequence(Transaction& t) {
  return TX(t).Work().exec("SELECT COALESCE(MAX(sequence),0) FROM settlement_events;")[0][0].as<uint64_t>();
}

} // namespace agentpay::db::postgres
