#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace workflow::db::postgres {

/*
  PgPool

  Bounded set of libpqxx connections shared by every PgTx.

  A connection is checked out for exactly one transaction: libpqxx
  connections are not thread-safe, and FOR UPDATE row locks belong to
  the session that took them. Every new connection gets the hot-path
  statements (lock, claim, insert, update) prepared before first use,
  so the schema must already exist. Acquire() blocks while all
  max_connections are checked out; closed connections are dropped on
  the way back out.

  The handle returned by Acquire() returns its connection to the pool
  when the last copy goes away, or closes it once the pool is gone.
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

} // namespace workflow::db::postgres
