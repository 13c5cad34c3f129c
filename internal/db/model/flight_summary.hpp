#pragma once

#include <cstdint>
#include <optional>

namespace flightline::db::model {

struct FlightSummary {
  uint64_t total_flights         = 0;
  uint64_t distinct_carriers     = 0;
  uint64_t distinct_origins      = 0;
  uint64_t distinct_destinations = 0;
  uint64_t cancellations         = 0;

  std::optional<double> avg_arr_delay;
};

} // namespace flightline::db::model
