#include "flight_row.hpp"

#include "internal/util/coerce.hpp"

namespace flightline::fact {

using util::ToDouble;
using util::ToFlag;
using util::ToInteger;
using util::ToText;

const std::vector<std::string>& FactColumns() {
  static const std::vector<std::string> kColumns = {
      "FlightDate",      "Reporting_Airline", "Tail_Number",     "Flight_Number_Reporting_Airline",
      "Origin",          "OriginCityName",    "OriginState",     "Dest",
      "DestCityName",    "DestState",         "CRSDepTime",      "DepTime",
      "DepDelay",        "DepDelayMinutes",   "DepDel15",        "CRSArrTime",
      "ArrTime",         "ArrDelay",          "ArrDelayMinutes", "ArrDel15",
      "Cancelled",       "CancellationCode",  "Diverted",        "Distance",
      "AirTime",         "CRSElapsedTime",    "ActualElapsedTime", "CarrierDelay",
      "WeatherDelay",    "NASDelay",          "SecurityDelay",   "LateAircraftDelay",
  };
  return kColumns;
}

const std::vector<std::string>& RequiredFactColumns() {
  static const std::vector<std::string> kColumns = {"FlightDate", "Reporting_Airline", "Origin", "Dest"};
  return kColumns;
}

db::model::FlightRecord CoerceFlightRow(const storage::csv::CsvRow& row, const std::string& flight_date) {
  db::model::FlightRecord r;
  r.flight_date         = flight_date;
  r.carrier_code        = ToText(row[kReportingAirline]).value_or("");
  r.tail_number         = ToText(row[kTailNumber]);
  r.flight_number       = ToInteger(row[kFlightNumber]);
  r.origin_airport      = ToText(row[kOrigin]).value_or("");
  r.origin_city         = ToText(row[kOriginCityName]);
  r.origin_state        = ToText(row[kOriginState]);
  r.dest_airport        = ToText(row[kDest]).value_or("");
  r.dest_city           = ToText(row[kDestCityName]);
  r.dest_state          = ToText(row[kDestState]);
  r.scheduled_dep       = ToText(row[kCrsDepTime]);
  r.actual_dep          = ToText(row[kDepTime]);
  r.dep_delay           = ToDouble(row[kDepDelay]);
  r.dep_delay_minutes   = ToDouble(row[kDepDelayMinutes]);
  r.dep_delay_15        = ToFlag(row[kDepDel15]);
  r.scheduled_arr       = ToText(row[kCrsArrTime]);
  r.actual_arr          = ToText(row[kArrTime]);
  r.arr_delay           = ToDouble(row[kArrDelay]);
  r.arr_delay_minutes   = ToDouble(row[kArrDelayMinutes]);
  r.arr_delay_15        = ToFlag(row[kArrDel15]);
  r.cancelled           = ToFlag(row[kCancelled]);
  r.cancellation_code   = ToText(row[kCancellationCode]);
  r.diverted            = ToFlag(row[kDiverted]);
  r.distance            = ToDouble(row[kDistance]);
  r.air_time            = ToDouble(row[kAirTime]);
  r.scheduled_elapsed   = ToDouble(row[kCrsElapsedTime]);
  r.actual_elapsed      = ToDouble(row[kActualElapsedTime]);
  r.carrier_delay       = ToDouble(row[kCarrierDelay]);
  r.weather_delay       = ToDouble(row[kWeatherDelay]);
  r.nas_delay           = ToDouble(row[kNasDelay]);
  r.security_delay      = ToDouble(row[kSecurityDelay]);
  r.late_aircraft_delay = ToDouble(row[kLateAircraftDelay]);
  return r;
}

} // namespace flightline::fact
