#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace flightline::db::model {

/*
  Natural key of the flights fact table. A null flight_number is a
  value of its own: two rows with null numbers and otherwise equal
  fields collide.
*/
struct FlightKey {
  std::string            flight_date;
  std::string            carrier_code;
  std::optional<int64_t> flight_number;
  std::string            origin_airport;

  auto operator<=>(const FlightKey&) const = default;
};

struct FlightRecord {
  std::string                flight_date; // YYYY-MM-DD
  std::string                carrier_code;
  std::optional<std::string> tail_number;
  std::optional<int64_t>     flight_number;

  std::string                origin_airport;
  std::optional<std::string> origin_city;
  std::optional<std::string> origin_state;

  std::string                dest_airport;
  std::optional<std::string> dest_city;
  std::optional<std::string> dest_state;

  std::optional<std::string> scheduled_dep; // hhmm
  std::optional<std::string> actual_dep;
  std::optional<double>      dep_delay;
  std::optional<double>      dep_delay_minutes;
  bool                       dep_delay_15 = false;

  std::optional<std::string> scheduled_arr;
  std::optional<std::string> actual_arr;
  std::optional<double>      arr_delay;
  std::optional<double>      arr_delay_minutes;
  bool                       arr_delay_15 = false;

  bool                       cancelled = false;
  std::optional<std::string> cancellation_code;
  bool                       diverted = false;
  std::optional<double>      distance;
  std::optional<double>      air_time;
  std::optional<double>      scheduled_elapsed;
  std::optional<double>      actual_elapsed;

  std::optional<double> carrier_delay;
  std::optional<double> weather_delay;
  std::optional<double> nas_delay;
  std::optional<double> security_delay;
  std::optional<double> late_aircraft_delay;

  FlightKey Key() const {
    return {flight_date, carrier_code, flight_number, origin_airport};
  }
};

} // namespace flightline::db::model
