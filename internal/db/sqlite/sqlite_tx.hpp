#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace agentpay::db::sqlite {

/*
  One ledger write on the shared SQLite connection.

  Holds SqliteDB::TransactionMutex() for its whole lifetime and opens with
  BEGIN IMMEDIATE, so the write lock is taken before the replay check reads
  and two settlements can never interleave on the same file.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace agentpay::db::sqlite
