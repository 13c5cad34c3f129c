#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/flight_record.hpp"
#include "internal/storage/csv/csv_reader.hpp"

namespace flightline::fact {

/*
  BTS on-time CSV projection. Position in FactColumns() is the index
  into a CsvRow read with that projection.
*/
enum FactColumn : std::size_t {
  kFlightDate = 0,
  kReportingAirline,
  kTailNumber,
  kFlightNumber,
  kOrigin,
  kOriginCityName,
  kOriginState,
  kDest,
  kDestCityName,
  kDestState,
  kCrsDepTime,
  kDepTime,
  kDepDelay,
  kDepDelayMinutes,
  kDepDel15,
  kCrsArrTime,
  kArrTime,
  kArrDelay,
  kArrDelayMinutes,
  kArrDel15,
  kCancelled,
  kCancellationCode,
  kDiverted,
  kDistance,
  kAirTime,
  kCrsElapsedTime,
  kActualElapsedTime,
  kCarrierDelay,
  kWeatherDelay,
  kNasDelay,
  kSecurityDelay,
  kLateAircraftDelay,
  kFactColumnCount,
};

const std::vector<std::string>& FactColumns();

// Columns whose absence makes a fact file structurally invalid.
const std::vector<std::string>& RequiredFactColumns();

/*
  Build the warehouse row for an accepted source row. flight_date is
  the canonical date the row was validated against; the key columns
  are taken trimmed as validated.
*/
db::model::FlightRecord CoerceFlightRow(const storage::csv::CsvRow& row, const std::string& flight_date);

} // namespace flightline::fact
