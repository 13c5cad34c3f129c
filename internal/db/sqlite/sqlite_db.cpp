#include "sqlite_db.hpp"

#include <array>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace flightline::db::sqlite {

namespace {

constexpr std::array<const char*, 4> kFilePragmas = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA temp_store=MEMORY;",
    "PRAGMA cache_size=-20000;", // KiB
};

[[noreturn]] void Fail(const std::string& what, const std::string& detail) {
  throw util::RepositoryError(ErrorCode::IOError, "sqlite " + what + ": " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    Fail("open " + path_, detail);
  }

  if (path_ != ":memory:") {
    for (const char* pragma : kFilePragmas) {
      Exec(pragma);
    }
  }
  // flights and weather reference the dimensions
  Exec("PRAGMA foreign_keys=ON;");
  sqlite3_busy_timeout(db_, busy_timeout_ms);
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  const std::string detail = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  Fail("exec", detail);
}

void ApplySchema(SqliteDB& db) {
  sql::RunMigrations(sql::SqliteSchema(), [&db](const std::string& statement) { db.Exec(statement); });
}

} // namespace flightline::db::sqlite
