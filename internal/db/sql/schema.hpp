#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace agentpay::db::sql {

/*
  Ledger schema, one statement per entry, idempotent (IF NOT EXISTS).

  Amounts are unsigned 64-bit. SQLite stores them bit-for-bit in INTEGER
  columns (values above INT64_MAX read back negative in raw SQL), Postgres
  in NUMERIC(20,0).
*/

// Bump when a statement below changes shape; stamped into SQLite user_version.
inline constexpr std::int64_t kLedgerSchemaVersion = 1;

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS consumed_payments (payment_id TEXT PRIMARY KEY, payer TEXT NOT NULL, agent_id INTEGER NOT NULL, "
      "sku_id INTEGER NOT NULL, amount INTEGER NOT NULL, consumed_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entitlements (agent_id INTEGER NOT NULL, payer TEXT NOT NULL, call_credits INTEGER NOT NULL, "
      "valid_until INTEGER NOT NULL, PRIMARY KEY (agent_id, payer));",
      "CREATE TABLE IF NOT EXISTS revenue_balances (beneficiary TEXT PRIMARY KEY, balance INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_config (id INTEGER PRIMARY KEY CHECK (id = 1), fee_basis_points INTEGER NOT NULL, treasury TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settlement_events (sequence INTEGER PRIMARY KEY, kind INTEGER NOT NULL, occurred_at INTEGER NOT NULL, "
      "payment_id TEXT NOT NULL, agent_id INTEGER NOT NULL, sku_id INTEGER NOT NULL, payer TEXT NOT NULL, beneficiary TEXT NOT NULL, "
      "treasury TEXT NOT NULL, amount INTEGER NOT NULL, fee INTEGER NOT NULL, net INTEGER NOT NULL, call_credits INTEGER NOT NULL, "
      "valid_until INTEGER NOT NULL, detail TEXT NOT NULL);"};
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS consumed_payments (payment_id TEXT PRIMARY KEY, payer TEXT NOT NULL, agent_id NUMERIC(20,0) NOT NULL, "
      "sku_id NUMERIC(20,0) NOT NULL, amount NUMERIC(20,0) NOT NULL, consumed_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entitlements (agent_id NUMERIC(20,0) NOT NULL, payer TEXT NOT NULL, call_credits NUMERIC(20,0) NOT NULL, "
      "valid_until NUMERIC(20,0) NOT NULL, PRIMARY KEY (agent_id, payer));",
      "CREATE TABLE IF NOT EXISTS revenue_balances (beneficiary TEXT PRIMARY KEY, balance NUMERIC(20,0) NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fee_config (id SMALLINT PRIMARY KEY CHECK (id = 1), fee_basis_points INTEGER NOT NULL, treasury TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS settlement_events (sequence BIGINT PRIMARY KEY, kind SMALLINT NOT NULL, occurred_at BIGINT NOT NULL, "
      "payment_id TEXT NOT NULL, agent_id NUMERIC(20,0) NOT NULL, sku_id NUMERIC(20,0) NOT NULL, payer TEXT NOT NULL, "
      "beneficiary TEXT NOT NULL, treasury TEXT NOT NULL, amount NUMERIC(20,0) NOT NULL, fee NUMERIC(20,0) NOT NULL, "
      "net NUMERIC(20,0) NOT NULL, call_credits NUMERIC(20,0) NOT NULL, valid_until NUMERIC(20,0) NOT NULL, detail TEXT NOT NULL);"};
  return kStatements;
}

} // namespace agentpay::db::sql
