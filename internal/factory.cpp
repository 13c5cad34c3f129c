#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/object/arrow_object_store.hpp"
#include "internal/weather/asos_csv_source.hpp"
#if FLIGHTLINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLIGHTLINE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flightline::factory {

std::shared_ptr<db::Repository> BuildRepository(const flightline::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLIGHTLINE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::ApplySchema(*sqlite_db);
    FLIGHTLINE_LOG_INFO("warehouse: sqlite", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLIGHTLINE_DB_POSTGRES
    const auto& pg        = database.postgres();
    const auto  max_conns = pg.max_connections() == 0 ? 8u : pg.max_connections();
    auto        pool      = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_conns);
    db::postgres::ApplySchema(*pool);
    FLIGHTLINE_LOG_INFO("warehouse: postgres", {observability::IntField("max_connections", max_conns)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLIGHTLINE_LOG_WARN("warehouse: in-memory, nothing is persisted");
  return std::make_shared<db::memory::MemoryRepository>();
}

pipeline::StageContext Build(const flightline::runtime::config::RuntimeConfig& config) {
  pipeline::StageContext ctx;
  ctx.config     = config;
  ctx.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Object storage
  // ------------------------------------------------------------------
  ctx.store = storage::ArrowObjectStore::FromConfig(config.storage());
  FLIGHTLINE_LOG_INFO("object store ready", {observability::StringField("root_uri", config.storage().root_uri())});

  ctx.observations = std::make_shared<weather::AsosCsvObservationSource>(ctx.store, config.storage().weather_prefix());
  return ctx;
}

} // namespace flightline::factory
