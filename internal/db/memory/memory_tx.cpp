#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace agentpay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen(const char* operation) const {
  if (committed_ || rolled_back_) {
    throw std::logic_error(std::string("memory transaction already finished: ") + operation);
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  EnsureOpen("write");
  if (!working_) {
    working_.emplace(*snapshot_);
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  EnsureOpen("commit");
  if (!working_) {
    committed_ = true;
    return;
  }

  auto next = std::make_shared<const MemoryRepository::State>(std::move(*working_));
  working_.reset();

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    rolled_back_ = true;
    throw util::InvalidState("ledger write conflict: version " + std::to_string(snapshot_version_) + " was superseded by " +
                             std::to_string(repo_.committed_version_));
  }
  repo_.committed_ = std::move(next);
  ++repo_.committed_version_;
  snapshot_  = repo_.committed_;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace agentpay::db::memory
