#include "pg_pool.hpp"

namespace agentpay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("payment_consumed", "SELECT 1 FROM consumed_payments WHERE payment_id=$1");

  conn.prepare("insert_consumed_payment",
               "INSERT INTO consumed_payments(payment_id,payer,agent_id,sku_id,amount,consumed_at) "
               "VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("get_entitlement", "SELECT call_credits,valid_until FROM entitlements WHERE agent_id=$1 AND payer=$2");

  conn.prepare("upsert_entitlement",
               "INSERT INTO entitlements(agent_id,payer,call_credits,valid_until) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(agent_id,payer) DO UPDATE SET call_credits=EXCLUDED.call_credits,valid_until=EXCLUDED.valid_until");

  conn.prepare("get_revenue_balance", "SELECT balance FROM revenue_balances WHERE beneficiary=$1");

  conn.prepare("upsert_revenue_balance",
               "INSERT INTO revenue_balances(beneficiary,balance) VALUES($1,$2) "
               "ON CONFLICT(beneficiary) DO UPDATE SET balance=EXCLUDED.balance");

  conn.prepare("put_fee_config",
               "INSERT INTO fee_config(id,fee_basis_points,treasury) VALUES(1,$1,$2) "
               "ON CONFLICT(id) DO UPDATE SET fee_basis_points=EXCLUDED.fee_basis_points,treasury=EXCLUDED.treasury");

  conn.prepare("append_event",
               "INSERT INTO settlement_events(sequence,kind,occurred_at,payment_id,agent_id,sku_id,payer,beneficiary,treasury,"
               "amount,fee,net,call_credits,valid_until,detail) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("read_events",
               "SELECT sequence,kind,occurred_at,payment_id,agent_id,sku_id,payer,beneficiary,treasury,amount,fee,net,"
               "call_credits,valid_until,detail FROM settlement_events WHERE sequence>$1 ORDER BY sequence ASC LIMIT $2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace agentpay::db::postgres
