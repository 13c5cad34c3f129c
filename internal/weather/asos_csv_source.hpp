#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/storage/csv/csv_reader.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/weather/observation_source.hpp"

namespace flightline::weather {

// Column order of an IEM ASOS hourly export.
const std::vector<std::string>& AsosColumns();

/*
  Conditions label from precipitation (in), temperature (F) and
  visibility (mi). Missing precipitation reads as 0, missing
  visibility as 10.
*/
std::string DetermineConditions(const db::model::WeatherObservationRecord& obs);

// "YYYY-MM-DD HH:MM" from an ASOS valid stamp; nullopt when the date part is not a calendar day.
std::optional<std::string> NormalizeObservationTime(std::string_view valid);

// One observation from a row projected with AsosColumns(); nullopt when valid is empty or malformed.
std::optional<db::model::WeatherObservationRecord> ParseAsosRow(const storage::csv::CsvRow& row,
                                                                const std::string&           airport_code);

/*
  AsosCsvObservationSource

  Reads <weather_prefix><station>.csv from object storage. Values "M"
  (missing) and "T" (trace) load as null. Wind speeds are converted
  from knots to mph.
*/
class AsosCsvObservationSource : public ObservationSource {
 public:
  AsosCsvObservationSource(std::shared_ptr<storage::ObjectStore> store, std::string weather_prefix);

  std::vector<db::model::WeatherObservationRecord> Fetch(const std::string& airport_code, const std::string& station_id,
                                                         const std::string& start_date,
                                                         const std::string& end_date) override;

 private:
  std::shared_ptr<storage::ObjectStore> store_;
  std::string                           weather_prefix_;
};

} // namespace flightline::weather
