#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace flightline::db::postgres {

/*
  PgPool

  At most max_connections pqxx connections, opened lazily. A connection
  belongs to one transaction at a time; the shared_ptr handed out by
  Acquire() returns it to the pool when the last copy goes away, or
  closes it once the pool itself is gone. Acquire() blocks while every
  connection is checked out.

  The ledger statements are prepared on every new connection.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 8);

  // Throws RepositoryError when a new connection cannot be opened.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  class Slot;

  std::unique_ptr<pqxx::connection> Open() const;
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

// Create warehouse tables and indexes if missing.
void ApplySchema(PgPool& pool);

} // namespace flightline::db::postgres
