#pragma once

namespace agentpay::db {

/*
  Unit of work over the settlement ledgers.

  A settlement touches the replay guard, an entitlement, two revenue
  balances and the event log. All of it lands in one transaction, so a
  failure at any step leaves every ledger as it was.

  Backends:
    memory    pinned snapshot, private copy on first write
    sqlite    BEGIN IMMEDIATE, one writer per database
    postgres  pqxx::work on a pooled connection

  A transaction that is destroyed without Commit() is rolled back.
  Commit() or Rollback() on a finished transaction throws.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  [[nodiscard]] virtual bool IsCommitted() const = 0;
};

} // namespace agentpay::db
