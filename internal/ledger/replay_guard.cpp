#include "internal/ledger/replay_guard.hpp"

#include "internal/ledger/ledger_error.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::ledger {

ReplayGuard::ReplayGuard(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

bool ReplayGuard::IsConsumed(db::Transaction& tx, const std::string& payment_id) const {
  return repository_->IsPaymentConsumed(tx, payment_id);
}

void ReplayGuard::Consume(db::Transaction& tx, const db::model::ConsumedPaymentRecord& record) {
  if (repository_->IsPaymentConsumed(tx, record.payment_id)) {
    throw util::ReplayError("payment id already settled: " + record.payment_id);
  }

  const auto result = repository_->InsertConsumedPayment(tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::ReplayError("payment id already settled: " + record.payment_id);
  }
  ThrowIfFailed(result, "consume payment id");
}

uint64_t ReplayGuard::Count(db::Transaction& tx) const {
  return repository_->CountConsumedPayments(tx);
}

} // namespace agentpay::ledger
