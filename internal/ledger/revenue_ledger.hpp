#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace agentpay::ledger {

/*
  RevenueLedger

  Withdrawable balance per beneficiary address. Balances never underflow;
  a credit that would overflow 64 bits is rejected.
*/
class RevenueLedger {
 public:
  explicit RevenueLedger(std::shared_ptr<db::Repository> repository);

  uint64_t BalanceOf(db::Transaction& tx, const std::string& beneficiary) const;

  // Returns the new balance.
  uint64_t Credit(db::Transaction& tx, const std::string& beneficiary, uint64_t amount);

  // Throws InsufficientBalanceError for amount == 0 or amount > balance.
  uint64_t Debit(db::Transaction& tx, const std::string& beneficiary, uint64_t amount);

  std::vector<db::model::RevenueBalanceRecord> List(db::Transaction& tx) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace agentpay::ledger
