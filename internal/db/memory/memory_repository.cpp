#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace agentpay::db::memory {

namespace {

std::string EntitlementKey(uint64_t agent_id, const std::string& payer) {
  return std::to_string(agent_id) + "#" + payer;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::IsPaymentConsumed(Transaction& t, const std::string& payment_id) {
  return TX(t).View().consumed_payments.contains(payment_id);
}

Result MemoryRepository::InsertConsumedPayment(Transaction& t, const model::ConsumedPaymentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.consumed_payments.contains(r.payment_id)) return Result::Err(ErrorCode::AlreadyExists, "payment already consumed: " + r.payment_id);
  s.consumed_payments[r.payment_id] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountConsumedPayments(Transaction& t) {
  return TX(t).View().consumed_payments.size();
}

std::optional<model::EntitlementRecord> MemoryRepository::GetEntitlement(Transaction& t, uint64_t agent_id, const std::string& payer) {
  const auto& s  = TX(t).View();
  auto        it = s.entitlements.find(EntitlementKey(agent_id, payer));
  if (it == s.entitlements.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  TX(t).Mutable().entitlements[EntitlementKey(r.agent_id, r.payer)] = r;
  return Result::Ok();
}

uint64_t MemoryRepository::CountEntitlements(Transaction& t) {
  return TX(t).View().entitlements.size();
}

std::optional<model::RevenueBalanceRecord> MemoryRepository::GetRevenueBalance(Transaction& t, const std::string& beneficiary) {
  const auto& s  = TX(t).View();
  auto        it = s.revenue_balances.find(beneficiary);
  if (it == s.revenue_balances.end()) return std::nullopt;
  return model::RevenueBalanceRecord{it->first, it->second};
}

Result MemoryRepository::UpsertRevenueBalance(Transaction& t, const model::RevenueBalanceRecord& r) {
  TX(t).Mutable().revenue_balances[r.beneficiary] = r.balance;
  return Result::Ok();
}

std::vector<model::RevenueBalanceRecord> MemoryRepository::ListRevenueBalances(Transaction& t) {
  const auto&                              s = TX(t).View();
  std::vector<model::RevenueBalanceRecord> records;
  records.reserve(s.revenue_balances.size());
  for (const auto& [beneficiary, balance] : s.revenue_balances) {
    records.push_back({beneficiary, balance});
  }
  return records;
}

std::optional<model::FeeConfigRecord> MemoryRepository::GetFeeConfig(Transaction& t) {
  return TX(t).View().fee_config;
}

Result MemoryRepository::PutFeeConfig(Transaction& t, const model::FeeConfigRecord& r) {
  TX(t).Mutable().fee_config = r;
  return Result::Ok();
}

Result MemoryRepository::AppendEvent(Transaction& t, model::SettlementEventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.events.size() + 1;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::SettlementEventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t after_sequence, uint64_t max_events) {
  const auto&                               s = TX(t).View();
  std::vector<model::SettlementEventRecord> out;
  if (after_sequence >= s.events.size()) {
    return out;
  }

  // sequences are dense and start at 1, so event N sits at index N-1
  const auto available = s.events.size() - after_sequence;
  const auto count     = max_events == 0 ? available : std::min<uint64_t>(available, max_events);
  out.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    out.push_back(s.events[after_sequence + i]);
  }
  return out;
}

uint64_t MemoryRepository::LastEventSequence(Transaction& t) {
  return TX(t).View().events.size();
}

} // namespace agentpay::db::memory
