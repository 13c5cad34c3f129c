#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flightline::db::sqlite {

using flightline::db::ErrorCode;
using flightline::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

constexpr const char* kRunColumns =
    "file_name,source,rows_processed,rows_loaded,rows_rejected,status,started_at,completed_at,error_message";

constexpr const char* kAirportColumns = "airport_code,airport_name,city,country,latitude,longitude,altitude,timezone";

constexpr const char* kDateColumns =
    "date_id,year,quarter,month,day_of_month,day_of_week,day_name,month_name,is_weekend,season";

constexpr const char* kFlightColumns =
    "flight_date,carrier_code,tail_number,flight_number,origin_airport,origin_city,origin_state,"
    "dest_airport,dest_city,dest_state,scheduled_dep,actual_dep,dep_delay,dep_delay_minutes,dep_delay_15,"
    "scheduled_arr,actual_arr,arr_delay,arr_delay_minutes,arr_delay_15,cancelled,cancellation_code,diverted,"
    "distance,air_time,scheduled_elapsed,actual_elapsed,carrier_delay,weather_delay,nas_delay,security_delay,"
    "late_aircraft_delay";

constexpr const char* kWeatherColumns =
    "airport_code,observation_date,observation_time,avg_temperature,max_temperature,min_temperature,"
    "avg_wind_speed,max_wind_speed,avg_visibility,precipitation,snow_depth,humidity,dew_point,conditions";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

// 0 is stored as NULL
void BindMillis(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindI64(st, idx, static_cast<int64_t>(v));
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

int PrepareStmt(sqlite3* db, const std::string& sql, StmtPtr& out) {
  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
  out.reset(raw);
  return rc;
}

StmtPtr PrepareOrThrow(sqlite3* db, const std::string& sql) {
  StmtPtr st(nullptr, &sqlite3_finalize);
  if (PrepareStmt(db, sql, st) != SQLITE_OK) {
    throw util::RepositoryError(ErrorCode::InternalError, std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

// true on SQLITE_ROW, false on SQLITE_DONE
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::RepositoryError(ErrorCode::IOError, std::string("sqlite step: ") + sqlite3_errmsg(db));
}

uint64_t QueryCount(sqlite3* db, const std::string& sql) {
  auto st = PrepareOrThrow(db, sql);
  if (!StepRow(db, st.get())) return 0;
  return ColU64(st.get(), 0);
}

std::vector<std::string> QueryStrings(sqlite3* db, const std::string& sql) {
  auto                     st = PrepareOrThrow(db, sql);
  std::vector<std::string> out;
  while (StepRow(db, st.get())) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

model::PipelineRunRecord ReadRun(sqlite3_stmt* st) {
  model::PipelineRunRecord r;
  r.file_name       = ColText(st, 0);
  r.source          = ColText(st, 1);
  r.rows_processed  = ColU64(st, 2);
  r.rows_loaded     = ColU64(st, 3);
  r.rows_rejected   = ColU64(st, 4);
  r.status          = model::ParseRunStatus(ColText(st, 5)).value_or(model::RunStatus::Failed);
  r.started_at_ms   = IsNull(st, 6) ? 0 : ColU64(st, 6);
  r.completed_at_ms = IsNull(st, 7) ? 0 : ColU64(st, 7);
  r.error_message   = ColOptText(st, 8).value_or("");
  return r;
}

model::FlightRecord ReadFlight(sqlite3_stmt* st) {
  model::FlightRecord r;
  r.flight_date         = ColText(st, 0);
  r.carrier_code        = ColText(st, 1);
  r.tail_number         = ColOptText(st, 2);
  r.flight_number       = ColOptI64(st, 3);
  r.origin_airport      = ColText(st, 4);
  r.origin_city         = ColOptText(st, 5);
  r.origin_state        = ColOptText(st, 6);
  r.dest_airport        = ColText(st, 7);
  r.dest_city           = ColOptText(st, 8);
  r.dest_state          = ColOptText(st, 9);
  r.scheduled_dep       = ColOptText(st, 10);
  r.actual_dep          = ColOptText(st, 11);
  r.dep_delay           = ColOptDouble(st, 12);
  r.dep_delay_minutes   = ColOptDouble(st, 13);
  r.dep_delay_15        = ColBool(st, 14);
  r.scheduled_arr       = ColOptText(st, 15);
  r.actual_arr          = ColOptText(st, 16);
  r.arr_delay           = ColOptDouble(st, 17);
  r.arr_delay_minutes   = ColOptDouble(st, 18);
  r.arr_delay_15        = ColBool(st, 19);
  r.cancelled           = ColBool(st, 20);
  r.cancellation_code   = ColOptText(st, 21);
  r.diverted            = ColBool(st, 22);
  r.distance            = ColOptDouble(st, 23);
  r.air_time            = ColOptDouble(st, 24);
  r.scheduled_elapsed   = ColOptDouble(st, 25);
  r.actual_elapsed      = ColOptDouble(st, 26);
  r.carrier_delay       = ColOptDouble(st, 27);
  r.weather_delay       = ColOptDouble(st, 28);
  r.nas_delay           = ColOptDouble(st, 29);
  r.security_delay      = ColOptDouble(st, 30);
  r.late_aircraft_delay = ColOptDouble(st, 31);
  return r;
}

void BindFlight(sqlite3_stmt* st, const model::FlightRecord& r) {
  BindText(st, 1, r.flight_date);
  BindText(st, 2, r.carrier_code);
  BindText(st, 3, r.tail_number);
  BindI64(st, 4, r.flight_number);
  BindText(st, 5, r.origin_airport);
  BindText(st, 6, r.origin_city);
  BindText(st, 7, r.origin_state);
  BindText(st, 8, r.dest_airport);
  BindText(st, 9, r.dest_city);
  BindText(st, 10, r.dest_state);
  BindText(st, 11, r.scheduled_dep);
  BindText(st, 12, r.actual_dep);
  BindDouble(st, 13, r.dep_delay);
  BindDouble(st, 14, r.dep_delay_minutes);
  BindBool(st, 15, r.dep_delay_15);
  BindText(st, 16, r.scheduled_arr);
  BindText(st, 17, r.actual_arr);
  BindDouble(st, 18, r.arr_delay);
  BindDouble(st, 19, r.arr_delay_minutes);
  BindBool(st, 20, r.arr_delay_15);
  BindBool(st, 21, r.cancelled);
  BindText(st, 22, r.cancellation_code);
  BindBool(st, 23, r.diverted);
  BindDouble(st, 24, r.distance);
  BindDouble(st, 25, r.air_time);
  BindDouble(st, 26, r.scheduled_elapsed);
  BindDouble(st, 27, r.actual_elapsed);
  BindDouble(st, 28, r.carrier_delay);
  BindDouble(st, 29, r.weather_delay);
  BindDouble(st, 30, r.nas_delay);
  BindDouble(st, 31, r.security_delay);
  BindDouble(st, 32, r.late_aircraft_delay);
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
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPipelineRun(Transaction& t, const model::PipelineRunRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO pipeline_runs(") + kRunColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?) "
                          "ON CONFLICT(file_name, source) DO UPDATE SET "
                          "rows_processed=excluded.rows_processed, rows_loaded=excluded.rows_loaded, "
                          "rows_rejected=excluded.rows_rejected, status=excluded.status, started_at=excluded.started_at, "
                          "completed_at=excluded.completed_at, error_message=excluded.error_message;";

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db, sql, st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.file_name);
  BindText(st.get(), 2, r.source);
  BindI64(st.get(), 3, static_cast<int64_t>(r.rows_processed));
  BindI64(st.get(), 4, static_cast<int64_t>(r.rows_loaded));
  BindI64(st.get(), 5, static_cast<int64_t>(r.rows_rejected));
  BindText(st.get(), 6, std::string(model::RunStatusName(r.status)));
  BindMillis(st.get(), 7, r.started_at_ms);
  BindMillis(st.get(), 8, r.completed_at_ms);
  BindText(st.get(), 9, r.error_message.empty() ? std::optional<std::string>{} : r.error_message);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PipelineRunRecord> SqliteRepository::GetPipelineRun(Transaction& t, const std::string& file_name,
                                                                         const std::string& source) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRunColumns + " FROM pipeline_runs WHERE file_name=? AND source=?;");
  BindText(st.get(), 1, file_name);
  BindText(st.get(), 2, source);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadRun(st.get());
}

std::vector<std::string> SqliteRepository::ListCompletedFiles(Transaction& t, const std::string& source) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT file_name FROM pipeline_runs WHERE source=? AND status='completed' ORDER BY file_name;");
  BindText(st.get(), 1, source);

  std::vector<std::string> files;
  while (StepRow(db, st.get())) {
    files.push_back(ColText(st.get(), 0));
  }
  return files;
}

std::optional<model::PipelineRunRecord> SqliteRepository::GetLatestCompletedRun(Transaction& t, const std::string& source) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRunColumns +
                                   " FROM pipeline_runs WHERE source=? AND status='completed' "
                                   "ORDER BY completed_at DESC, run_id DESC LIMIT 1;");
  BindText(st.get(), 1, source);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadRun(st.get());
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result SqliteRepository::InsertAirports(Transaction& t, const std::vector<model::AirportRecord>& records) {
  auto* db = TX(t).Handle();

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db, std::string("INSERT INTO airports(") + kAirportColumns + ") VALUES(?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindText(st.get(), 1, r.airport_code);
    BindText(st.get(), 2, r.airport_name);
    BindText(st.get(), 3, r.city);
    BindText(st.get(), 4, r.country);
    BindDouble(st.get(), 5, r.latitude);
    BindDouble(st.get(), 6, r.longitude);
    BindI64(st.get(), 7, r.altitude);
    BindText(st.get(), 8, r.timezone);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

std::optional<model::AirportRecord> SqliteRepository::GetAirport(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kAirportColumns + " FROM airports WHERE airport_code=?;");
  BindText(st.get(), 1, code);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::AirportRecord r;
  r.airport_code = ColText(st.get(), 0);
  r.airport_name = ColText(st.get(), 1);
  r.city         = ColOptText(st.get(), 2);
  r.country      = ColOptText(st.get(), 3);
  r.latitude     = ColOptDouble(st.get(), 4);
  r.longitude    = ColOptDouble(st.get(), 5);
  r.altitude     = ColOptI64(st.get(), 6);
  r.timezone     = ColOptText(st.get(), 7);
  return r;
}

std::vector<std::string> SqliteRepository::ListAirportCodes(Transaction& t) {
  return QueryStrings(TX(t).Handle(), "SELECT airport_code FROM airports ORDER BY airport_code;");
}

Result SqliteRepository::InsertCarriers(Transaction& t, const std::vector<model::CarrierRecord>& records) {
  auto* db = TX(t).Handle();

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db, "INSERT INTO carriers(carrier_code,carrier_name,dot_id) VALUES(?,?,?) ON CONFLICT DO NOTHING;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindText(st.get(), 1, r.carrier_code);
    BindText(st.get(), 2, r.carrier_name);
    BindI64(st.get(), 3, r.dot_id);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

std::optional<model::CarrierRecord> SqliteRepository::GetCarrier(Transaction& t, const std::string& code) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT carrier_code,carrier_name,dot_id FROM carriers WHERE carrier_code=?;");
  BindText(st.get(), 1, code);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::CarrierRecord r;
  r.carrier_code = ColText(st.get(), 0);
  r.carrier_name = ColText(st.get(), 1);
  r.dot_id       = ColOptI64(st.get(), 2);
  return r;
}

std::vector<std::string> SqliteRepository::ListCarrierCodes(Transaction& t) {
  return QueryStrings(TX(t).Handle(), "SELECT carrier_code FROM carriers ORDER BY carrier_code;");
}

Result SqliteRepository::InsertDates(Transaction& t, const std::vector<model::DateRecord>& records) {
  auto* db = TX(t).Handle();

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db, std::string("INSERT INTO date_dim(") + kDateColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;", st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindText(st.get(), 1, r.date_id);
    BindI64(st.get(), 2, r.year);
    BindI64(st.get(), 3, r.quarter);
    BindI64(st.get(), 4, r.month);
    BindI64(st.get(), 5, r.day_of_month);
    BindI64(st.get(), 6, r.day_of_week);
    BindText(st.get(), 7, r.day_name);
    BindText(st.get(), 8, r.month_name);
    BindBool(st.get(), 9, r.is_weekend);
    BindText(st.get(), 10, r.season);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

std::optional<model::DateRecord> SqliteRepository::GetDate(Transaction& t, const std::string& date_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kDateColumns + " FROM date_dim WHERE date_id=?;");
  BindText(st.get(), 1, date_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::DateRecord r;
  r.date_id      = ColText(st.get(), 0);
  r.year         = sqlite3_column_int(st.get(), 1);
  r.quarter      = sqlite3_column_int(st.get(), 2);
  r.month        = sqlite3_column_int(st.get(), 3);
  r.day_of_month = sqlite3_column_int(st.get(), 4);
  r.day_of_week  = sqlite3_column_int(st.get(), 5);
  r.day_name     = ColText(st.get(), 6);
  r.month_name   = ColText(st.get(), 7);
  r.is_weekend   = ColBool(st.get(), 8);
  r.season       = ColText(st.get(), 9);
  return r;
}

std::vector<std::string> SqliteRepository::ListDates(Transaction& t) {
  return QueryStrings(TX(t).Handle(), "SELECT date_id FROM date_dim ORDER BY date_id;");
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result SqliteRepository::InsertFlights(Transaction& t, const std::vector<model::FlightRecord>& records) {
  auto* db = TX(t).Handle();

  // conflict target omitted: the natural key is an expression index
  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db,
                           std::string("INSERT INTO flights(") + kFlightColumns +
                               ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;",
                           st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindFlight(st.get(), r);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

std::optional<model::FlightRecord> SqliteRepository::GetFlight(Transaction& t, const model::FlightKey& key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kFlightColumns +
                                   " FROM flights WHERE flight_date=? AND carrier_code=? "
                                   "AND IFNULL(flight_number, -1)=IFNULL(?, -1) AND origin_airport=?;");
  BindText(st.get(), 1, key.flight_date);
  BindText(st.get(), 2, key.carrier_code);
  BindI64(st.get(), 3, key.flight_number);
  BindText(st.get(), 4, key.origin_airport);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadFlight(st.get());
}

Result SqliteRepository::AppendRejectedRecords(Transaction& t, const std::vector<model::RejectedRecord>& records) {
  auto* db = TX(t).Handle();

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db,
                           "INSERT INTO rejected_records(source,file_name,row_number,raw_data,rejection_reason) "
                           "VALUES(?,?,?,?,?);",
                           st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindText(st.get(), 1, r.source);
    BindText(st.get(), 2, r.file_name);
    BindI64(st.get(), 3, static_cast<int64_t>(r.row_number));
    BindText(st.get(), 4, r.raw_data);
    BindText(st.get(), 5, r.rejection_reason);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

std::vector<model::RejectedRecord> SqliteRepository::ListRejectedRecords(Transaction& t, const std::string& source,
                                                                         const std::string& file_name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT source,file_name,row_number,raw_data,rejection_reason FROM rejected_records "
                            "WHERE source=? AND file_name=? ORDER BY rejected_id;");
  BindText(st.get(), 1, source);
  BindText(st.get(), 2, file_name);

  std::vector<model::RejectedRecord> out;
  while (StepRow(db, st.get())) {
    model::RejectedRecord r;
    r.source           = ColText(st.get(), 0);
    r.file_name        = ColText(st.get(), 1);
    r.row_number       = ColU64(st.get(), 2);
    r.raw_data         = ColText(st.get(), 3);
    r.rejection_reason = ColText(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Weather
// ------------------------------------------------------------------

std::vector<model::WeatherKey> SqliteRepository::ListWeatherKeys(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT airport_code,observation_time FROM weather_observations ORDER BY airport_code,observation_time;");

  std::vector<model::WeatherKey> keys;
  while (StepRow(db, st.get())) {
    keys.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
  }
  return keys;
}

Result SqliteRepository::InsertWeatherObservations(Transaction& t, const std::vector<model::WeatherObservationRecord>& records) {
  auto* db = TX(t).Handle();

  StmtPtr st(nullptr, &sqlite3_finalize);
  int     rc = PrepareStmt(db,
                           std::string("INSERT INTO weather_observations(") + kWeatherColumns +
                               ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(airport_code, observation_time) DO NOTHING;",
                           st);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (const auto& r : records) {
    BindText(st.get(), 1, r.airport_code);
    BindText(st.get(), 2, r.observation_date);
    BindText(st.get(), 3, r.observation_time);
    BindDouble(st.get(), 4, r.avg_temperature);
    BindDouble(st.get(), 5, r.max_temperature);
    BindDouble(st.get(), 6, r.min_temperature);
    BindDouble(st.get(), 7, r.avg_wind_speed);
    BindDouble(st.get(), 8, r.max_wind_speed);
    BindDouble(st.get(), 9, r.avg_visibility);
    BindDouble(st.get(), 10, r.precipitation);
    BindDouble(st.get(), 11, r.snow_depth);
    BindDouble(st.get(), 12, r.humidity);
    BindDouble(st.get(), 13, r.dew_point);
    BindText(st.get(), 14, r.conditions);

    rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Aggregates
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountRows(Transaction& t, Table table) {
  return QueryCount(TX(t).Handle(), std::string("SELECT COUNT(*) FROM ") + TableName(table) + ";");
}

uint64_t SqliteRepository::CountOrphanFlights(Transaction& t, FlightEndpoint endpoint) {
  const char* column = endpoint == FlightEndpoint::Origin ? "origin_airport" : "dest_airport";
  return QueryCount(TX(t).Handle(), std::string("SELECT COUNT(*) FROM flights f LEFT JOIN airports a ON f.") + column +
                                        " = a.airport_code WHERE a.airport_code IS NULL;");
}

uint64_t SqliteRepository::CountDelaysOutOfRange(Transaction& t, double floor, double ceiling) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT COUNT(*) FROM flights WHERE (arr_delay < ?1 OR arr_delay > ?2) "
                            "OR (dep_delay < ?1 OR dep_delay > ?2);");
  sqlite3_bind_double(st.get(), 1, floor);
  sqlite3_bind_double(st.get(), 2, ceiling);
  if (!StepRow(db, st.get())) return 0;
  return ColU64(st.get(), 0);
}

uint64_t SqliteRepository::CountWeatherAirportsInDimension(Transaction& t) {
  return QueryCount(TX(t).Handle(),
                    "SELECT COUNT(DISTINCT w.airport_code) FROM weather_observations w "
                    "JOIN airports a ON a.airport_code = w.airport_code;");
}

uint64_t SqliteRepository::CountWeatherDatesInDimension(Transaction& t) {
  return QueryCount(TX(t).Handle(),
                    "SELECT COUNT(DISTINCT w.observation_date) FROM weather_observations w "
                    "JOIN date_dim d ON d.date_id = w.observation_date;");
}

model::FlightSummary SqliteRepository::SummarizeFlights(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT COUNT(*), COUNT(DISTINCT carrier_code), COUNT(DISTINCT origin_airport), "
                            "COUNT(DISTINCT dest_airport), COALESCE(SUM(CASE WHEN cancelled THEN 1 ELSE 0 END), 0), "
                            "AVG(arr_delay) FROM flights;");

  model::FlightSummary summary;
  if (!StepRow(db, st.get())) return summary;
  summary.total_flights         = ColU64(st.get(), 0);
  summary.distinct_carriers     = ColU64(st.get(), 1);
  summary.distinct_origins      = ColU64(st.get(), 2);
  summary.distinct_destinations = ColU64(st.get(), 3);
  summary.cancellations         = ColU64(st.get(), 4);
  summary.avg_arr_delay         = ColOptDouble(st.get(), 5);
  return summary;
}

} // namespace flightline::db::sqlite
