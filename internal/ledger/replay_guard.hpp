#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace agentpay::ledger {

/*
  ReplayGuard

  Write-once set of settled payment ids. A consumed id is never released,
  even when the settlement that burned it later fails.
*/
class ReplayGuard {
 public:
  explicit ReplayGuard(std::shared_ptr<db::Repository> repository);

  bool IsConsumed(db::Transaction& tx, const std::string& payment_id) const;

  // Throws ReplayError if the id was consumed before.
  void Consume(db::Transaction& tx, const db::model::ConsumedPaymentRecord& record);

  uint64_t Count(db::Transaction& tx) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace agentpay::ledger
