#include "migrations.hpp"

namespace flightline::db::sql {

void RunMigrations(const std::vector<std::string>& ordered_sql, const StatementRunner& run) {
  for (const auto& statement : ordered_sql) {
    run(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS carriers (carrier_code TEXT PRIMARY KEY, carrier_name TEXT NOT NULL, dot_id INTEGER);",

      "CREATE TABLE IF NOT EXISTS airports (airport_code TEXT PRIMARY KEY, airport_name TEXT NOT NULL, city TEXT, country TEXT, "
      "latitude REAL, longitude REAL, altitude INTEGER, timezone TEXT);",

      "CREATE TABLE IF NOT EXISTS date_dim (date_id TEXT PRIMARY KEY, year INTEGER NOT NULL, quarter INTEGER NOT NULL, "
      "month INTEGER NOT NULL, day_of_month INTEGER NOT NULL, day_of_week INTEGER NOT NULL, day_name TEXT NOT NULL, "
      "month_name TEXT NOT NULL, is_weekend INTEGER NOT NULL, season TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS flights (flight_id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "flight_date TEXT NOT NULL REFERENCES date_dim(date_id), carrier_code TEXT NOT NULL REFERENCES carriers(carrier_code), "
      "tail_number TEXT, flight_number INTEGER, "
      "origin_airport TEXT NOT NULL REFERENCES airports(airport_code), origin_city TEXT, origin_state TEXT, "
      "dest_airport TEXT NOT NULL REFERENCES airports(airport_code), dest_city TEXT, dest_state TEXT, "
      "scheduled_dep TEXT, actual_dep TEXT, dep_delay REAL, dep_delay_minutes REAL, dep_delay_15 INTEGER, "
      "scheduled_arr TEXT, actual_arr TEXT, arr_delay REAL, arr_delay_minutes REAL, arr_delay_15 INTEGER, "
      "cancelled INTEGER NOT NULL DEFAULT 0, cancellation_code TEXT, diverted INTEGER NOT NULL DEFAULT 0, "
      "distance REAL, air_time REAL, scheduled_elapsed REAL, actual_elapsed REAL, "
      "carrier_delay REAL, weather_delay REAL, nas_delay REAL, security_delay REAL, late_aircraft_delay REAL);",

      // null flight numbers collide with each other
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_flights_natural_key ON flights(flight_date, carrier_code, IFNULL(flight_number, -1), origin_airport);",
      "CREATE INDEX IF NOT EXISTS idx_flights_date ON flights(flight_date);",
      "CREATE INDEX IF NOT EXISTS idx_flights_carrier ON flights(carrier_code);",
      "CREATE INDEX IF NOT EXISTS idx_flights_origin ON flights(origin_airport);",
      "CREATE INDEX IF NOT EXISTS idx_flights_dest ON flights(dest_airport);",

      "CREATE TABLE IF NOT EXISTS weather_observations (observation_id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "airport_code TEXT NOT NULL REFERENCES airports(airport_code), observation_date TEXT NOT NULL REFERENCES date_dim(date_id), "
      "observation_time TEXT NOT NULL, avg_temperature REAL, max_temperature REAL, min_temperature REAL, "
      "avg_wind_speed REAL, max_wind_speed REAL, avg_visibility REAL, precipitation REAL, snow_depth REAL, "
      "humidity REAL, dew_point REAL, conditions TEXT, UNIQUE(airport_code, observation_time));",
      "CREATE INDEX IF NOT EXISTS idx_weather_airport_date ON weather_observations(airport_code, observation_date);",

      "CREATE TABLE IF NOT EXISTS pipeline_runs (run_id INTEGER PRIMARY KEY AUTOINCREMENT, file_name TEXT NOT NULL, source TEXT NOT NULL, "
      "rows_processed INTEGER NOT NULL DEFAULT 0, rows_loaded INTEGER NOT NULL DEFAULT 0, rows_rejected INTEGER NOT NULL DEFAULT 0, "
      "status TEXT NOT NULL, started_at INTEGER, completed_at INTEGER, error_message TEXT, UNIQUE(file_name, source));",

      "CREATE TABLE IF NOT EXISTS rejected_records (rejected_id INTEGER PRIMARY KEY AUTOINCREMENT, source TEXT NOT NULL, "
      "file_name TEXT NOT NULL, row_number INTEGER NOT NULL, raw_data TEXT, rejection_reason TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_rejected_file ON rejected_records(source, file_name);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS carriers (carrier_code VARCHAR(10) PRIMARY KEY, carrier_name TEXT NOT NULL, dot_id INTEGER, "
      "created_at TIMESTAMPTZ DEFAULT NOW());",

      "CREATE TABLE IF NOT EXISTS airports (airport_code VARCHAR(10) PRIMARY KEY, airport_name TEXT NOT NULL, city TEXT, country TEXT, "
      "latitude DOUBLE PRECISION, longitude DOUBLE PRECISION, altitude INTEGER, timezone TEXT, created_at TIMESTAMPTZ DEFAULT NOW());",

      "CREATE TABLE IF NOT EXISTS date_dim (date_id DATE PRIMARY KEY, year INTEGER NOT NULL, quarter INTEGER NOT NULL, "
      "month INTEGER NOT NULL, day_of_month INTEGER NOT NULL, day_of_week INTEGER NOT NULL, day_name VARCHAR(10) NOT NULL, "
      "month_name VARCHAR(10) NOT NULL, is_weekend BOOLEAN NOT NULL, season VARCHAR(10) NOT NULL);",

      "CREATE TABLE IF NOT EXISTS flights (flight_id BIGSERIAL PRIMARY KEY, "
      "flight_date DATE NOT NULL REFERENCES date_dim(date_id), carrier_code VARCHAR(10) NOT NULL REFERENCES carriers(carrier_code), "
      "tail_number VARCHAR(20), flight_number INTEGER, "
      "origin_airport VARCHAR(10) NOT NULL REFERENCES airports(airport_code), origin_city TEXT, origin_state VARCHAR(5), "
      "dest_airport VARCHAR(10) NOT NULL REFERENCES airports(airport_code), dest_city TEXT, dest_state VARCHAR(5), "
      "scheduled_dep VARCHAR(10), actual_dep VARCHAR(10), dep_delay DOUBLE PRECISION, dep_delay_minutes DOUBLE PRECISION, dep_delay_15 BOOLEAN, "
      "scheduled_arr VARCHAR(10), actual_arr VARCHAR(10), arr_delay DOUBLE PRECISION, arr_delay_minutes DOUBLE PRECISION, arr_delay_15 BOOLEAN, "
      "cancelled BOOLEAN DEFAULT FALSE, cancellation_code VARCHAR(5), diverted BOOLEAN DEFAULT FALSE, "
      "distance DOUBLE PRECISION, air_time DOUBLE PRECISION, scheduled_elapsed DOUBLE PRECISION, actual_elapsed DOUBLE PRECISION, "
      "carrier_delay DOUBLE PRECISION, weather_delay DOUBLE PRECISION, nas_delay DOUBLE PRECISION, security_delay DOUBLE PRECISION, "
      "late_aircraft_delay DOUBLE PRECISION, "
      "CONSTRAINT flights_natural_key UNIQUE NULLS NOT DISTINCT (flight_date, carrier_code, flight_number, origin_airport));",
      "CREATE INDEX IF NOT EXISTS idx_flights_date ON flights(flight_date);",
      "CREATE INDEX IF NOT EXISTS idx_flights_carrier ON flights(carrier_code);",
      "CREATE INDEX IF NOT EXISTS idx_flights_origin ON flights(origin_airport);",
      "CREATE INDEX IF NOT EXISTS idx_flights_dest ON flights(dest_airport);",
      "CREATE INDEX IF NOT EXISTS idx_flights_arr_delay ON flights(arr_delay);",
      "CREATE INDEX IF NOT EXISTS idx_flights_origin_date ON flights(origin_airport, flight_date);",
      "CREATE INDEX IF NOT EXISTS idx_flights_carrier_date ON flights(carrier_code, flight_date);",

      "CREATE TABLE IF NOT EXISTS weather_observations (observation_id BIGSERIAL PRIMARY KEY, "
      "airport_code VARCHAR(10) NOT NULL REFERENCES airports(airport_code), observation_date DATE NOT NULL REFERENCES date_dim(date_id), "
      "observation_time TIMESTAMP NOT NULL, avg_temperature DOUBLE PRECISION, max_temperature DOUBLE PRECISION, "
      "min_temperature DOUBLE PRECISION, avg_wind_speed DOUBLE PRECISION, max_wind_speed DOUBLE PRECISION, "
      "avg_visibility DOUBLE PRECISION, precipitation DOUBLE PRECISION, snow_depth DOUBLE PRECISION, "
      "humidity DOUBLE PRECISION, dew_point DOUBLE PRECISION, conditions TEXT, UNIQUE (airport_code, observation_time));",
      "CREATE INDEX IF NOT EXISTS idx_weather_airport_date ON weather_observations(airport_code, observation_date);",

      "CREATE TABLE IF NOT EXISTS pipeline_runs (run_id SERIAL PRIMARY KEY, file_name TEXT NOT NULL, source VARCHAR(50) NOT NULL, "
      "rows_processed BIGINT NOT NULL DEFAULT 0, rows_loaded BIGINT NOT NULL DEFAULT 0, rows_rejected BIGINT NOT NULL DEFAULT 0, "
      "status VARCHAR(20) NOT NULL, started_at TIMESTAMPTZ, completed_at TIMESTAMPTZ, error_message TEXT, "
      "UNIQUE (file_name, source));",

      "CREATE TABLE IF NOT EXISTS rejected_records (rejected_id BIGSERIAL PRIMARY KEY, source VARCHAR(50) NOT NULL, "
      "file_name TEXT NOT NULL, row_number BIGINT NOT NULL, raw_data TEXT, rejection_reason TEXT NOT NULL, "
      "created_at TIMESTAMPTZ DEFAULT NOW());",
      "CREATE INDEX IF NOT EXISTS idx_rejected_file ON rejected_records(source, file_name);",
  };
  return kSchema;
}

} // namespace flightline::db::sql
