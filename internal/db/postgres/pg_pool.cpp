#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace flightline::db::postgres {

// Reserves one unit of capacity; released unless Keep() is called.
class PgPool::Slot {
 public:
  explicit Slot(PgPool& pool) : pool_(pool) {
  }

  ~Slot() {
    if (!kept_) {
      std::lock_guard lock(pool_.mutex_);
      --pool_.open_;
      pool_.cv_.notify_one();
    }
  }

  void Keep() {
    kept_ = true;
  }

 private:
  PgPool& pool_;
  bool    kept_ = false;
};

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::unique_ptr<pqxx::connection> PgPool::Open() const {
  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
  } catch (const pqxx::broken_connection& e) {
    throw util::RepositoryError(ErrorCode::IOError, std::string("postgres connect: ") + e.what());
  }

  conn->prepare("upsert_pipeline_run",
                "INSERT INTO pipeline_runs(file_name,source,rows_processed,rows_loaded,rows_rejected,status,"
                "started_at,completed_at,error_message) "
                "VALUES($1,$2,$3,$4,$5,$6,to_timestamp($7::bigint / 1000.0),to_timestamp($8::bigint / 1000.0),$9) "
                "ON CONFLICT (file_name, source) DO UPDATE SET rows_processed=EXCLUDED.rows_processed, "
                "rows_loaded=EXCLUDED.rows_loaded, rows_rejected=EXCLUDED.rows_rejected, status=EXCLUDED.status, "
                "started_at=EXCLUDED.started_at, completed_at=EXCLUDED.completed_at, error_message=EXCLUDED.error_message;");

  conn->prepare("get_pipeline_run",
                "SELECT file_name,source,rows_processed,rows_loaded,rows_rejected,status,"
                "(EXTRACT(EPOCH FROM started_at) * 1000)::bigint,(EXTRACT(EPOCH FROM completed_at) * 1000)::bigint,"
                "error_message FROM pipeline_runs WHERE file_name=$1 AND source=$2;");
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

  while (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Lend(std::move(conn));
    }
    // closed by the server while idle
    --open_;
  }

  ++open_;
  lock.unlock();

  Slot slot(*this);
  auto conn = Open();
  slot.Keep();
  return Lend(std::move(conn));
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->GiveBack(returned);
    } else {
      delete returned;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void ApplySchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  sql::RunMigrations(sql::PostgresSchema(), [&tx](const std::string& statement) { tx.exec(statement); });
  tx.commit();
}

} // namespace flightline::db::postgres
