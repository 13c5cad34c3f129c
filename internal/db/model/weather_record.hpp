#pragma once

#include <compare>
#include <optional>
#include <string>

namespace flightline::db::model {

struct WeatherKey {
  std::string airport_code;
  std::string observation_time; // "YYYY-MM-DD HH:MM"

  auto operator<=>(const WeatherKey&) const = default;
};

struct WeatherObservationRecord {
  std::string airport_code;
  std::string observation_date; // YYYY-MM-DD
  std::string observation_time;

  std::optional<double> avg_temperature; // F
  std::optional<double> max_temperature;
  std::optional<double> min_temperature;
  std::optional<double> avg_wind_speed; // mph
  std::optional<double> max_wind_speed;
  std::optional<double> avg_visibility; // miles
  std::optional<double> precipitation;  // inches
  std::optional<double> snow_depth;
  std::optional<double> humidity; // percent
  std::optional<double> dew_point;

  std::optional<std::string> conditions;

  WeatherKey Key() const {
    return {airport_code, observation_time};
  }
};

} // namespace flightline::db::model
