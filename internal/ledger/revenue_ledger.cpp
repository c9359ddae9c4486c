#include "internal/ledger/revenue_ledger.hpp"

#include <limits>

#include "internal/ledger/ledger_error.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::ledger {

RevenueLedger::RevenueLedger(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t RevenueLedger::BalanceOf(db::Transaction& tx, const std::string& beneficiary) const {
  const auto record = repository_->GetRevenueBalance(tx, beneficiary);
  return record ? record->balance : 0;
}

uint64_t RevenueLedger::Credit(db::Transaction& tx, const std::string& beneficiary, uint64_t amount) {
  const uint64_t current = BalanceOf(tx, beneficiary);
  if (amount > std::numeric_limits<uint64_t>::max() - current) {
    throw util::InvalidState("revenue balance overflow for " + beneficiary);
  }
  const uint64_t updated = current + amount;
  ThrowIfFailed(repository_->UpsertRevenueBalance(tx, {beneficiary, updated}), "credit revenue");
  return updated;
}

uint64_t RevenueLedger::Debit(db::Transaction& tx, const std::string& beneficiary, uint64_t amount) {
  const uint64_t current = BalanceOf(tx, beneficiary);
  if (amount == 0 || amount > current) {
    throw util::InsufficientBalanceError("cannot withdraw " + std::to_string(amount) + " from balance " + std::to_string(current) +
                                         " of " + beneficiary);
  }
  const uint64_t updated = current - amount;
  ThrowIfFailed(repository_->UpsertRevenueBalance(tx, {beneficiary, updated}), "debit revenue");
  return updated;
}

std::vector<db::model::RevenueBalanceRecord> RevenueLedger::List(db::Transaction& tx) const {
  return repository_->ListRevenueBalances(tx);
}

} // namespace agentpay::ledger
