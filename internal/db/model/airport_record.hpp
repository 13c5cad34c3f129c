#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flightline::db::model {

struct AirportRecord {
  std::string airport_code; // IATA, 3 letters
  std::string airport_name;

  std::optional<std::string> city;
  std::optional<std::string> country;
  std::optional<double>      latitude;
  std::optional<double>      longitude;
  std::optional<int64_t>     altitude;
  std::optional<std::string> timezone;
};

} // namespace flightline::db::model
