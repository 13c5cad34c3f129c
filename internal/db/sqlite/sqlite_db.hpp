#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace flightline::db::sqlite {

/*
  SqliteDB

  Owns the single sqlite3 connection behind SqliteRepository. Every
  transaction locks TxMutex() for its lifetime, so stages running on
  different threads never interleave inside one BEGIN ... COMMIT.

  File databases run in WAL mode with foreign keys enforced; ":memory:"
  keeps the default journal.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Pragmas, DDL and transaction control. Throws RepositoryError.
  void Exec(const std::string& sql);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Create warehouse tables and indexes if missing.
void ApplySchema(SqliteDB& db);

} // namespace flightline::db::sqlite
