#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace agentpay::db::memory {

/*
  Snapshot transaction over the in-memory ledgers.

  Begin pins the committed state without copying it. The first Mutable()
  call takes a private copy that Commit publishes, provided no other
  writer committed in between. A transaction that only read commits
  without touching the repository, so balance and entitlement lookups
  never conflict with settlements.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  void EnsureOpen(const char* operation) const;

  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::optional<MemoryRepository::State>         working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace agentpay::db::memory
