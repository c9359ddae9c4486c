#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace agentpay::db::sqlite {

using agentpay::db::ErrorCode;
using agentpay::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Reads run inside the caller's transaction; a failed prepare means a broken
// schema, which must surface instead of looking like an empty table.
Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

int Step(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return rc;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// bit-preserving: uint64 values above INT64_MAX round-trip through the sign bit
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::SettlementEventRecord ReadEventRow(sqlite3_stmt* st) {
  model::SettlementEventRecord r;
  r.sequence     = ColU64(st, 0);
  r.kind         = static_cast<agentpay::settlement::v1::SettlementEventKind>(sqlite3_column_int(st, 1));
  r.occurred_at  = ColU64(st, 2);
  r.payment_id   = ColText(st, 3);
  r.agent_id     = ColU64(st, 4);
  r.sku_id       = ColU64(st, 5);
  r.payer        = ColText(st, 6);
  r.beneficiary  = ColText(st, 7);
  r.treasury     = ColText(st, 8);
  r.amount       = ColU64(st, 9);
  r.fee          = ColU64(st, 10);
  r.net          = ColU64(st, 11);
  r.call_credits = ColU64(st, 12);
  r.valid_until  = ColU64(st, 13);
  r.detail       = ColText(st, 14);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Replay protection
// ------------------------------------------------------------------

bool SqliteRepository::IsPaymentConsumed(Transaction& t, const std::string& payment_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT 1 FROM consumed_payments WHERE payment_id=?;");
  BindText(st.get(), 1, payment_id);
  return Step(db, st.get()) == SQLITE_ROW;
}

Result SqliteRepository::InsertConsumedPayment(Transaction& t, const model::ConsumedPaymentRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO consumed_payments(payment_id,payer,agent_id,sku_id,amount,consumed_at) VALUES(?,?,?,?,?,?);",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(st.get(), 1, r.payment_id);
  BindText(st.get(), 2, r.payer);
  BindU64(st.get(), 3, r.agent_id);
  BindU64(st.get(), 4, r.sku_id);
  BindU64(st.get(), 5, r.amount);
  BindU64(st.get(), 6, r.consumed_at);

  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountConsumedPayments(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM consumed_payments;");
  Step(db, st.get());
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Entitlements
// ------------------------------------------------------------------

std::optional<model::EntitlementRecord> SqliteRepository::GetEntitlement(Transaction& t, uint64_t agent_id, const std::string& payer) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT call_credits,valid_until FROM entitlements WHERE agent_id=? AND payer=?;");
  BindU64(st.get(), 1, agent_id);
  BindText(st.get(), 2, payer);

  if (Step(db, st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  model::EntitlementRecord r;
  r.agent_id     = agent_id;
  r.payer        = payer;
  r.call_credits = ColU64(st.get(), 0);
  r.valid_until  = ColU64(st.get(), 1);
  return r;
}

Result SqliteRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO entitlements(agent_id,payer,call_credits,valid_until) VALUES(?,?,?,?) "
                         "ON CONFLICT(agent_id,payer) DO UPDATE SET call_credits=excluded.call_credits,valid_until=excluded.valid_until;",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindU64(st.get(), 1, r.agent_id);
  BindText(st.get(), 2, r.payer);
  BindU64(st.get(), 3, r.call_credits);
  BindU64(st.get(), 4, r.valid_until);

  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountEntitlements(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM entitlements;");
  Step(db, st.get());
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Revenue
// ------------------------------------------------------------------

std::optional<model::RevenueBalanceRecord> SqliteRepository::GetRevenueBalance(Transaction& t, const std::string& beneficiary) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT balance FROM revenue_balances WHERE beneficiary=?;");
  BindText(st.get(), 1, beneficiary);

  if (Step(db, st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return model::RevenueBalanceRecord{beneficiary, ColU64(st.get(), 0)};
}

Result SqliteRepository::UpsertRevenueBalance(Transaction& t, const model::RevenueBalanceRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO revenue_balances(beneficiary,balance) VALUES(?,?) "
                         "ON CONFLICT(beneficiary) DO UPDATE SET balance=excluded.balance;",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(st.get(), 1, r.beneficiary);
  BindU64(st.get(), 2, r.balance);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RevenueBalanceRecord> SqliteRepository::ListRevenueBalances(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT beneficiary,balance FROM revenue_balances ORDER BY beneficiary ASC;");

  std::vector<model::RevenueBalanceRecord> out;
  while (Step(db, st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColU64(st.get(), 1)});
  }
  return out;
}

// ------------------------------------------------------------------
// Fee configuration
// ------------------------------------------------------------------

std::optional<model::FeeConfigRecord> SqliteRepository::GetFeeConfig(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT fee_basis_points,treasury FROM fee_config WHERE id=1;");

  if (Step(db, st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  model::FeeConfigRecord r;
  r.fee_basis_points = static_cast<uint32_t>(sqlite3_column_int64(st.get(), 0));
  r.treasury         = ColText(st.get(), 1);
  return r;
}

Result SqliteRepository::PutFeeConfig(Transaction& t, const model::FeeConfigRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO fee_config(id,fee_basis_points,treasury) VALUES(1,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET fee_basis_points=excluded.fee_basis_points,treasury=excluded.treasury;",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(r.fee_basis_points));
  BindText(st.get(), 2, r.treasury);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::SettlementEventRecord& r) {
  auto* db = TX(t).Handle();

  // BEGIN IMMEDIATE holds the write lock, so MAX+1 cannot race
  const uint64_t sequence = LastEventSequence(t) + 1;

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO settlement_events(sequence,kind,occurred_at,payment_id,agent_id,sku_id,payer,beneficiary,treasury,"
                         "amount,fee,net,call_credits,valid_until,detail) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);",
                         -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindU64(st.get(), 1, sequence);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.kind));
  BindU64(st.get(), 3, r.occurred_at);
  BindText(st.get(), 4, r.payment_id);
  BindU64(st.get(), 5, r.agent_id);
  BindU64(st.get(), 6, r.sku_id);
  BindText(st.get(), 7, r.payer);
  BindText(st.get(), 8, r.beneficiary);
  BindText(st.get(), 9, r.treasury);
  BindU64(st.get(), 10, r.amount);
  BindU64(st.get(), 11, r.fee);
  BindU64(st.get(), 12, r.net);
  BindU64(st.get(), 13, r.call_credits);
  BindU64(st.get(), 14, r.valid_until);
  BindText(st.get(), 15, r.detail);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) {
    r.sequence = sequence;
  }
  return result;
}

std::vector<model::SettlementEventRecord> SqliteRepository::ReadEvents(Transaction& t, uint64_t after_sequence, uint64_t max_events) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT sequence,kind,occurred_at,payment_id,agent_id,sku_id,payer,beneficiary,treasury,amount,fee,net,call_credits,"
                     "valid_until,detail FROM settlement_events WHERE sequence>? ORDER BY sequence ASC LIMIT ?;");
  BindU64(st.get(), 1, after_sequence);
  // LIMIT -1 means unbounded in sqlite
  sqlite3_bind_int64(st.get(), 2, max_events == 0 ? -1 : static_cast<sqlite3_int64>(max_events));

  std::vector<model::SettlementEventRecord> out;
  while (Step(db, st.get()) == SQLITE_ROW) {
    out.push_back(ReadEventRow(st.get()));
  }
  return out;
}

uint64_t SqliteRepository::LastEventSequence(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COALESCE(MAX(sequence),0) FROM settlement_events;");
  Step(db, st.get());
  return ColU64(st.get(), 0);
}

} // namespace agentpay::db::sqlite
