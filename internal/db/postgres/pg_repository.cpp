#include "pg_repository.hpp"

#include <tuple>

namespace flightline::db::postgres {

using flightline::db::ErrorCode;
using flightline::db::Result;

namespace {

constexpr const char* kFlightSelect =
    "SELECT flight_date::text,carrier_code,tail_number,flight_number,origin_airport,origin_city,origin_state,"
    "dest_airport,dest_city,dest_state,scheduled_dep,actual_dep,dep_delay,dep_delay_minutes,COALESCE(dep_delay_15,false),"
    "scheduled_arr,actual_arr,arr_delay,arr_delay_minutes,COALESCE(arr_delay_15,false),COALESCE(cancelled,false),"
    "cancellation_code,COALESCE(diverted,false),distance,air_time,scheduled_elapsed,actual_elapsed,carrier_delay,"
    "weather_delay,nas_delay,security_delay,late_aircraft_delay FROM flights ";

constexpr const char* kFlightColumns =
    "flight_date,carrier_code,tail_number,flight_number,origin_airport,origin_city,origin_state,"
    "dest_airport,dest_city,dest_state,scheduled_dep,actual_dep,dep_delay,dep_delay_minutes,dep_delay_15,"
    "scheduled_arr,actual_arr,arr_delay,arr_delay_minutes,arr_delay_15,cancelled,cancellation_code,diverted,"
    "distance,air_time,scheduled_elapsed,actual_elapsed,carrier_delay,weather_delay,nas_delay,security_delay,"
    "late_aircraft_delay";

constexpr const char* kRunSelect =
    "SELECT file_name,source,rows_processed,rows_loaded,rows_rejected,status,"
    "(EXTRACT(EPOCH FROM started_at) * 1000)::bigint,(EXTRACT(EPOCH FROM completed_at) * 1000)::bigint,error_message "
    "FROM pipeline_runs ";

// 0 is stored as NULL
std::optional<int64_t> Millis(uint64_t ms) {
  if (ms == 0) return std::nullopt;
  return static_cast<int64_t>(ms);
}

std::optional<std::string> NonEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::PipelineRunRecord ReadRun(const pqxx::row& row) {
  model::PipelineRunRecord r;
  r.file_name       = row[0].c_str();
  r.source          = row[1].c_str();
  r.rows_processed  = row[2].as<uint64_t>();
  r.rows_loaded     = row[3].as<uint64_t>();
  r.rows_rejected   = row[4].as<uint64_t>();
  r.status          = model::ParseRunStatus(row[5].c_str()).value_or(model::RunStatus::Failed);
  r.started_at_ms   = row[6].is_null() ? 0 : row[6].as<uint64_t>();
  r.completed_at_ms = row[7].is_null() ? 0 : row[7].as<uint64_t>();
  r.error_message   = row[8].is_null() ? "" : row[8].c_str();
  return r;
}

model::FlightRecord ReadFlight(const pqxx::row& row) {
  model::FlightRecord r;
  r.flight_date         = row[0].c_str();
  r.carrier_code        = row[1].c_str();
  r.tail_number         = row[2].get<std::string>();
  r.flight_number       = row[3].get<int64_t>();
  r.origin_airport      = row[4].c_str();
  r.origin_city         = row[5].get<std::string>();
  r.origin_state        = row[6].get<std::string>();
  r.dest_airport        = row[7].c_str();
  r.dest_city           = row[8].get<std::string>();
  r.dest_state          = row[9].get<std::string>();
  r.scheduled_dep       = row[10].get<std::string>();
  r.actual_dep          = row[11].get<std::string>();
  r.dep_delay           = row[12].get<double>();
  r.dep_delay_minutes   = row[13].get<double>();
  r.dep_delay_15        = row[14].as<bool>();
  r.scheduled_arr       = row[15].get<std::string>();
  r.actual_arr          = row[16].get<std::string>();
  r.arr_delay           = row[17].get<double>();
  r.arr_delay_minutes   = row[18].get<double>();
  r.arr_delay_15        = row[19].as<bool>();
  r.cancelled           = row[20].as<bool>();
  r.cancellation_code   = row[21].get<std::string>();
  r.diverted            = row[22].as<bool>();
  r.distance            = row[23].get<double>();
  r.air_time            = row[24].get<double>();
  r.scheduled_elapsed   = row[25].get<double>();
  r.actual_elapsed      = row[26].get<double>();
  r.carrier_delay       = row[27].get<double>();
  r.weather_delay       = row[28].get<double>();
  r.nas_delay           = row[29].get<double>();
  r.security_delay      = row[30].get<double>();
  r.late_aircraft_delay = row[31].get<double>();
  return r;
}

uint64_t QueryCount(pqxx::work& w, const std::string& sql) {
  return w.query_value<uint64_t>(sql);
}

std::vector<std::string> QueryStrings(pqxx::work& w, const std::string& sql) {
  std::vector<std::string> out;
  for (const auto& row : w.exec(sql)) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::UpsertPipelineRun(Transaction& t, const model::PipelineRunRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_pipeline_run", r.file_name, r.source, static_cast<int64_t>(r.rows_processed),
                               static_cast<int64_t>(r.rows_loaded), static_cast<int64_t>(r.rows_rejected),
                               std::string(model::RunStatusName(r.status)), Millis(r.started_at_ms),
                               Millis(r.completed_at_ms), NonEmpty(r.error_message));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PipelineRunRecord> PgRepository::GetPipelineRun(Transaction& t, const std::string& file_name,
                                                                     const std::string& source) {
  auto res = TX(t).Work().exec_prepared("get_pipeline_run", file_name, source);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<std::string> PgRepository::ListCompletedFiles(Transaction& t, const std::string& source) {
  auto res = TX(t).Work().exec_params(
      "SELECT file_name FROM pipeline_runs WHERE source=$1 AND status='completed' ORDER BY file_name;", source);

  std::vector<std::string> files;
  files.reserve(res.size());
  for (const auto& row : res) {
    files.emplace_back(row[0].c_str());
  }
  return files;
}

std::optional<model::PipelineRunRecord> PgRepository::GetLatestCompletedRun(Transaction& t, const std::string& source) {
  auto res = TX(t).Work().exec_params(std::string(kRunSelect) +
                                          "WHERE source=$1 AND status='completed' "
                                          "ORDER BY completed_at DESC NULLS LAST, run_id DESC LIMIT 1;",
                                      source);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result PgRepository::InsertAirports(Transaction& t, const std::vector<model::AirportRecord>& records) {
  try {
    auto& w = TX(t).Work();
    for (const auto& r : records) {
      w.exec_params("INSERT INTO airports(airport_code,airport_name,city,country,latitude,longitude,altitude,timezone) "
                    "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT (airport_code) DO NOTHING;",
                    r.airport_code, r.airport_name, r.city, r.country, r.latitude, r.longitude, r.altitude, r.timezone);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AirportRecord> PgRepository::GetAirport(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_params(
      "SELECT airport_code,airport_name,city,country,latitude,longitude,altitude,timezone FROM airports WHERE airport_code=$1;",
      code);
  if (res.empty()) return std::nullopt;

  const auto&          row = res[0];
  model::AirportRecord r;
  r.airport_code = row[0].c_str();
  r.airport_name = row[1].c_str();
  r.city         = row[2].get<std::string>();
  r.country      = row[3].get<std::string>();
  r.latitude     = row[4].get<double>();
  r.longitude    = row[5].get<double>();
  r.altitude     = row[6].get<int64_t>();
  r.timezone     = row[7].get<std::string>();
  return r;
}

std::vector<std::string> PgRepository::ListAirportCodes(Transaction& t) {
  return QueryStrings(TX(t).Work(), "SELECT airport_code FROM airports ORDER BY airport_code;");
}

Result PgRepository::InsertCarriers(Transaction& t, const std::vector<model::CarrierRecord>& records) {
  try {
    auto& w = TX(t).Work();
    for (const auto& r : records) {
      w.exec_params("INSERT INTO carriers(carrier_code,carrier_name,dot_id) VALUES($1,$2,$3) ON CONFLICT (carrier_code) DO NOTHING;",
                    r.carrier_code, r.carrier_name, r.dot_id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CarrierRecord> PgRepository::GetCarrier(Transaction& t, const std::string& code) {
  auto res = TX(t).Work().exec_params("SELECT carrier_code,carrier_name,dot_id FROM carriers WHERE carrier_code=$1;", code);
  if (res.empty()) return std::nullopt;

  model::CarrierRecord r;
  r.carrier_code = res[0][0].c_str();
  r.carrier_name = res[0][1].c_str();
  r.dot_id       = res[0][2].get<int64_t>();
  return r;
}

std::vector<std::string> PgRepository::ListCarrierCodes(Transaction& t) {
  return QueryStrings(TX(t).Work(), "SELECT carrier_code FROM carriers ORDER BY carrier_code;");
}

Result PgRepository::InsertDates(Transaction& t, const std::vector<model::DateRecord>& records) {
  try {
    auto& w = TX(t).Work();
    for (const auto& r : records) {
      w.exec_params("INSERT INTO date_dim(date_id,year,quarter,month,day_of_month,day_of_week,day_name,month_name,is_weekend,season) "
                    "VALUES($1::date,$2,$3,$4,$5,$6,$7,$8,$9,$10) ON CONFLICT (date_id) DO NOTHING;",
                    r.date_id, r.year, r.quarter, r.month, r.day_of_month, r.day_of_week, r.day_name, r.month_name,
                    r.is_weekend, r.season);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DateRecord> PgRepository::GetDate(Transaction& t, const std::string& date_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT date_id::text,year,quarter,month,day_of_month,day_of_week,day_name,month_name,is_weekend,season "
      "FROM date_dim WHERE date_id=$1::date;",
      date_id);
  if (res.empty()) return std::nullopt;

  const auto&       row = res[0];
  model::DateRecord r;
  r.date_id      = row[0].c_str();
  r.year         = row[1].as<int>();
  r.quarter      = row[2].as<int>();
  r.month        = row[3].as<int>();
  r.day_of_month = row[4].as<int>();
  r.day_of_week  = row[5].as<int>();
  r.day_name     = row[6].c_str();
  r.month_name   = row[7].c_str();
  r.is_weekend   = row[8].as<bool>();
  r.season       = row[9].c_str();
  return r;
}

std::vector<std::string> PgRepository::ListDates(Transaction& t) {
  return QueryStrings(TX(t).Work(), "SELECT date_id::text FROM date_dim ORDER BY date_id;");
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

/*
  Chunks are streamed with COPY into a session-local staging table and
  merged with one INSERT ... SELECT so duplicates inside the chunk and
  against committed rows are both skipped by the natural-key constraint.
*/
Result PgRepository::InsertFlights(Transaction& t, const std::vector<model::FlightRecord>& records) {
  if (records.empty()) return Result::Ok();

  try {
    auto& w = TX(t).Work();
    w.exec(std::string("CREATE TEMP TABLE IF NOT EXISTS flights_staging ON COMMIT DELETE ROWS AS SELECT ") + kFlightColumns +
           " FROM flights WITH NO DATA;");
    w.exec("TRUNCATE flights_staging;");

    auto stream = pqxx::stream_to::table(
        w, {"flights_staging"},
        {"flight_date",     "carrier_code",  "tail_number",       "flight_number",     "origin_airport", "origin_city",
         "origin_state",    "dest_airport",  "dest_city",         "dest_state",        "scheduled_dep",  "actual_dep",
         "dep_delay",       "dep_delay_minutes", "dep_delay_15",  "scheduled_arr",     "actual_arr",     "arr_delay",
         "arr_delay_minutes", "arr_delay_15", "cancelled",        "cancellation_code", "diverted",       "distance",
         "air_time",        "scheduled_elapsed", "actual_elapsed", "carrier_delay",    "weather_delay",  "nas_delay",
         "security_delay",  "late_aircraft_delay"});

    for (const auto& r : records) {
      stream << std::make_tuple(r.flight_date, r.carrier_code, r.tail_number, r.flight_number, r.origin_airport,
                                r.origin_city, r.origin_state, r.dest_airport, r.dest_city, r.dest_state,
                                r.scheduled_dep, r.actual_dep, r.dep_delay, r.dep_delay_minutes, r.dep_delay_15,
                                r.scheduled_arr, r.actual_arr, r.arr_delay, r.arr_delay_minutes, r.arr_delay_15,
                                r.cancelled, r.cancellation_code, r.diverted, r.distance, r.air_time,
                                r.scheduled_elapsed, r.actual_elapsed, r.carrier_delay, r.weather_delay, r.nas_delay,
                                r.security_delay, r.late_aircraft_delay);
    }
    stream.complete();

    w.exec(std::string("INSERT INTO flights(") + kFlightColumns + ") SELECT " + kFlightColumns +
           " FROM flights_staging ON CONFLICT ON CONSTRAINT flights_natural_key DO NOTHING;");
    w.exec("TRUNCATE flights_staging;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FlightRecord> PgRepository::GetFlight(Transaction& t, const model::FlightKey& key) {
  auto res = TX(t).Work().exec_params(std::string(kFlightSelect) +
                                          "WHERE flight_date=$1::date AND carrier_code=$2 "
                                          "AND flight_number IS NOT DISTINCT FROM $3::integer AND origin_airport=$4;",
                                      key.flight_date, key.carrier_code, key.flight_number, key.origin_airport);
  if (res.empty()) return std::nullopt;
  return ReadFlight(res[0]);
}

Result PgRepository::AppendRejectedRecords(Transaction& t, const std::vector<model::RejectedRecord>& records) {
  if (records.empty()) return Result::Ok();

  try {
    auto stream = pqxx::stream_to::table(TX(t).Work(), {"rejected_records"},
                                         {"source", "file_name", "row_number", "raw_data", "rejection_reason"});
    for (const auto& r : records) {
      stream << std::make_tuple(r.source, r.file_name, static_cast<int64_t>(r.row_number), r.raw_data, r.rejection_reason);
    }
    stream.complete();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RejectedRecord> PgRepository::ListRejectedRecords(Transaction& t, const std::string& source,
                                                                     const std::string& file_name) {
  auto res = TX(t).Work().exec_params(
      "SELECT source,file_name,row_number,raw_data,rejection_reason FROM rejected_records "
      "WHERE source=$1 AND file_name=$2 ORDER BY rejected_id;",
      source, file_name);

  std::vector<model::RejectedRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RejectedRecord r;
    r.source           = row[0].c_str();
    r.file_name        = row[1].c_str();
    r.row_number       = row[2].as<uint64_t>();
    r.raw_data         = row[3].is_null() ? "" : row[3].c_str();
    r.rejection_reason = row[4].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Weather
// ------------------------------------------------------------------

std::vector<model::WeatherKey> PgRepository::ListWeatherKeys(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT airport_code, to_char(observation_time, 'YYYY-MM-DD HH24:MI') FROM weather_observations "
      "ORDER BY airport_code, observation_time;");

  std::vector<model::WeatherKey> keys;
  keys.reserve(res.size());
  for (const auto& row : res) {
    keys.push_back({row[0].c_str(), row[1].c_str()});
  }
  return keys;
}

Result PgRepository::InsertWeatherObservations(Transaction& t, const std::vector<model::WeatherObservationRecord>& records) {
  try {
    auto& w = TX(t).Work();
    for (const auto& r : records) {
      w.exec_params("INSERT INTO weather_observations(airport_code,observation_date,observation_time,avg_temperature,"
                    "max_temperature,min_temperature,avg_wind_speed,max_wind_speed,avg_visibility,precipitation,"
                    "snow_depth,humidity,dew_point,conditions) "
                    "VALUES($1,$2::date,$3::timestamp,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) "
                    "ON CONFLICT (airport_code, observation_time) DO NOTHING;",
                    r.airport_code, r.observation_date, r.observation_time, r.avg_temperature, r.max_temperature,
                    r.min_temperature, r.avg_wind_speed, r.max_wind_speed, r.avg_visibility, r.precipitation,
                    r.snow_depth, r.humidity, r.dew_point, r.conditions);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Aggregates
// ------------------------------------------------------------------

uint64_t PgRepository::CountRows(Transaction& t, Table table) {
  return QueryCount(TX(t).Work(), std::string("SELECT COUNT(*) FROM ") + TableName(table) + ";");
}

uint64_t PgRepository::CountOrphanFlights(Transaction& t, FlightEndpoint endpoint) {
  const char* column = endpoint == FlightEndpoint::Origin ? "origin_airport" : "dest_airport";
  return QueryCount(TX(t).Work(), std::string("SELECT COUNT(*) FROM flights f LEFT JOIN airports a ON f.") + column +
                                      " = a.airport_code WHERE a.airport_code IS NULL;");
}

uint64_t PgRepository::CountDelaysOutOfRange(Transaction& t, double floor, double ceiling) {
  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*) FROM flights WHERE (arr_delay < $1 OR arr_delay > $2) OR (dep_delay < $1 OR dep_delay > $2);",
      floor, ceiling);
  return res[0][0].as<uint64_t>();
}

uint64_t PgRepository::CountWeatherAirportsInDimension(Transaction& t) {
  return QueryCount(TX(t).Work(),
                    "SELECT COUNT(DISTINCT w.airport_code) FROM weather_observations w "
                    "JOIN airports a ON a.airport_code = w.airport_code;");
}

uint64_t PgRepository::CountWeatherDatesInDimension(Transaction& t) {
  return QueryCount(TX(t).Work(),
                    "SELECT COUNT(DISTINCT w.observation_date) FROM weather_observations w "
                    "JOIN date_dim d ON d.date_id = w.observation_date;");
}

model::FlightSummary PgRepository::SummarizeFlights(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT COUNT(*), COUNT(DISTINCT carrier_code), COUNT(DISTINCT origin_airport), COUNT(DISTINCT dest_airport), "
      "COUNT(*) FILTER (WHERE cancelled), AVG(arr_delay) FROM flights;");

  model::FlightSummary summary;
  const auto&          row = res[0];
  summary.total_flights         = row[0].as<uint64_t>();
  summary.distinct_carriers     = row[1].as<uint64_t>();
  summary.distinct_origins      = row[2].as<uint64_t>();
  summary.distinct_destinations = row[3].as<uint64_t>();
  summary.cancellations         = row[4].as<uint64_t>();
  summary.avg_arr_delay         = row[5].get<double>();
  return summary;
}

} // namespace flightline::db::postgres
