#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace agentpay::db::sqlite {

/*
  Owns the sqlite3 handle for one ledger database file.

  Every transaction runs on this single connection, serialized by
  TransactionMutex(). The schema version lives in PRAGMA user_version so a
  binary never writes to a ledger laid out by a newer release.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // First column of the first row, 0 when the query yields no rows.
  std::int64_t QueryInt64(const std::string& sql);

  std::int64_t UserVersion();

  // Runs the statements in one transaction and stamps user_version.
  // Throws util::InvalidState if the file already carries a newer version.
  void ApplySchema(const std::vector<std::string>& statements, std::int64_t version);

  bool WalEnabled() const {
    return wal_enabled_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_enabled_ = false;
  std::mutex  tx_mutex_;
};

} // namespace agentpay::db::sqlite
