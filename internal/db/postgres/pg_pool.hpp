#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace agentpay::db::postgres {

/*
  Connections for the Postgres ledger backend.

  A pqxx::connection is single-threaded, so each ledger transaction checks
  one out for its whole lifetime and Acquire() blocks once max_connections
  are in use. New connections get the ledger statements prepared before
  they are handed out.

  Acquire() returns a shared_ptr whose deleter parks the connection back in
  the idle list. Broken connections are dropped instead, and once the pool
  itself is gone the connection is simply closed.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace agentpay::db::postgres
