#pragma once

#include <string>
#include <vector>

#include "internal/db/model/weather_record.hpp"

namespace flightline::weather {

/*
  Supplier of hourly surface observations for one station.

  Fetch returns observations whose observation_date lies in
  [start_date, end_date] (inclusive, YYYY-MM-DD) with airport_code set
  to the requested airport. A station with no data yields an empty
  list; an unreadable source throws.
*/
class ObservationSource {
 public:
  virtual ~ObservationSource() = default;

  virtual std::vector<db::model::WeatherObservationRecord> Fetch(const std::string& airport_code,
                                                                 const std::string& station_id,
                                                                 const std::string& start_date,
                                                                 const std::string& end_date) = 0;
};

} // namespace flightline::weather
