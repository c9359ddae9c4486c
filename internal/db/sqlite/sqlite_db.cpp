#include "sqlite_db.hpp"

#include <memory>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace agentpay::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  if (path_.empty()) {
    throw util::InvalidArgument("sqlite ledger path must not be empty");
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open sqlite ledger " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

std::int64_t SqliteDB::QueryInt64(const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr), db_, "sqlite prepare");
  std::unique_ptr<sqlite3_stmt, StatementFinalizer> st(raw);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    return sqlite3_column_int64(st.get(), 0);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }
  return 0;
}

std::int64_t SqliteDB::UserVersion() {
  return QueryInt64("PRAGMA user_version;");
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements, std::int64_t version) {
  std::scoped_lock lock(tx_mutex_);

  const auto current = UserVersion();
  if (current > version) {
    throw util::InvalidState("ledger " + path_ + " has schema version " + std::to_string(current) + ", this build supports up to " +
                             std::to_string(version));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) {
      Exec(sql);
    }
    // PRAGMA does not accept bound parameters
    Exec("PRAGMA user_version=" + std::to_string(version) + ";");
    Exec("COMMIT;");
  } catch (const std::exception&) {
    if (sqlite3_get_autocommit(db_) == 0) {
      Exec("ROLLBACK;");
    }
    throw;
  }

  if (current != version) {
    AGENTPAY_LOG_INFO("sqlite ledger schema applied", {observability::StringField("path", path_), observability::IntField("from", current),
                                                       observability::IntField("to", version)});
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL keeps HasAccess and balance readers off the writer's lock
  if (wal_mode) {
    sqlite3_stmt* raw = nullptr;
    ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA journal_mode=WAL;", -1, &raw, nullptr), db_, "sqlite prepare");
    std::unique_ptr<sqlite3_stmt, StatementFinalizer> st(raw);
    if (sqlite3_step(st.get()) == SQLITE_ROW) {
      const auto* mode = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0));
      wal_enabled_     = mode != nullptr && std::string(mode) == "wal";
    }
    if (!wal_enabled_) {
      AGENTPAY_LOG_WARN("sqlite ledger is not in WAL mode", {observability::StringField("path", path_)});
    }
  }

  // FULL: a committed payment id burn must survive power loss
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "sqlite busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace agentpay::db::sqlite
