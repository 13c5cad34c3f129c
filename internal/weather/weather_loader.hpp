#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/weather/observation_source.hpp"

namespace flightline::weather {

struct WeatherLoadResult {
  uint64_t airports = 0; // airports with a station mapping present in the warehouse
  uint64_t dates    = 0;
  uint64_t fetched  = 0;
  uint64_t loaded   = 0;
  uint64_t skipped  = 0; // already stored or repeated within the batch
};

/*
  WeatherLoader

  Loads observations for warehouse airports that have a station
  mapping, restricted to dates present in date_dim. Pairs
  (airport_code, observation_time) already stored or repeated within
  the batch are skipped before the single insert, so re-runs with
  overlapping observations change nothing for pairs already seen.
*/
class WeatherLoader {
 public:
  WeatherLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<ObservationSource> source,
                std::shared_ptr<ledger::Ledger> ledger, std::map<std::string, std::string> airport_stations,
                std::string source_name);

  WeatherLoadResult Run();

 private:
  std::shared_ptr<db::Repository>    repo_;
  std::shared_ptr<ObservationSource> source_;
  std::shared_ptr<ledger::Ledger>    ledger_;
  std::map<std::string, std::string> airport_stations_;
  std::string                        source_name_;
};

} // namespace flightline::weather
