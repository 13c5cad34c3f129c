#include "asos_csv_source.hpp"

#include <cmath>

#include "internal/dimension/date_dim.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/coerce.hpp"

namespace flightline::weather {

namespace {

constexpr double kMphPerKnot = 1.15078;

enum AsosColumn : std::size_t {
  kStation = 0,
  kValid,
  kTempF,
  kDewPointF,
  kRelHumidity,
  kWindKnots,
  kVisibility,
  kPrecip1h,
};

double RoundTenth(double value) {
  return std::round(value * 10.0) / 10.0;
}

} // namespace

const std::vector<std::string>& AsosColumns() {
  static const std::vector<std::string> kColumns = {"station", "valid", "tmpf", "dwpf", "relh", "sknt", "vsby", "p01i"};
  return kColumns;
}

std::string DetermineConditions(const db::model::WeatherObservationRecord& obs) {
  const double precip     = obs.precipitation.value_or(0.0);
  const double visibility = obs.avg_visibility.value_or(10.0);
  const auto&  temp       = obs.avg_temperature;

  if (precip > 0 && temp && *temp < 32) return "Snow";
  if (precip > 0.1) return "Rain";
  if (precip > 0) return "Light Rain";
  if (visibility < 3) return "Fog/Low Visibility";
  if (temp && *temp < 32) return "Cold/Clear";
  return "Clear";
}

std::optional<std::string> NormalizeObservationTime(std::string_view valid) {
  const auto space = valid.find(' ');
  const auto date  = dimension::NormalizeDate(valid.substr(0, space));
  if (!date) {
    return std::nullopt;
  }
  if (space == std::string_view::npos) {
    return *date + " 00:00";
  }

  // HH:MM, dropping seconds
  auto clock = valid.substr(space + 1, 5);
  if (clock.size() != 5 || clock[2] != ':') {
    return std::nullopt;
  }
  return *date + " " + std::string(clock);
}

std::optional<db::model::WeatherObservationRecord> ParseAsosRow(const storage::csv::CsvRow& row,
                                                                const std::string&           airport_code) {
  auto valid = util::ToText(row[kValid]);
  if (!valid) {
    return std::nullopt;
  }
  auto time = NormalizeObservationTime(*valid);
  if (!time) {
    return std::nullopt;
  }

  db::model::WeatherObservationRecord obs;
  obs.airport_code     = airport_code;
  obs.observation_date = time->substr(0, 10);
  obs.observation_time = std::move(*time);
  obs.avg_temperature  = util::ToDouble(row[kTempF]);
  obs.dew_point        = util::ToDouble(row[kDewPointF]);
  obs.humidity         = util::ToDouble(row[kRelHumidity]);
  obs.avg_visibility   = util::ToDouble(row[kVisibility]);
  obs.precipitation    = util::ToDouble(row[kPrecip1h]);

  if (auto knots = util::ToDouble(row[kWindKnots])) {
    obs.avg_wind_speed = RoundTenth(*knots * kMphPerKnot);
  }

  obs.conditions = DetermineConditions(obs);
  return obs;
}

AsosCsvObservationSource::AsosCsvObservationSource(std::shared_ptr<storage::ObjectStore> store, std::string weather_prefix)
    : store_(std::move(store)), weather_prefix_(std::move(weather_prefix)) {
}

std::vector<db::model::WeatherObservationRecord> AsosCsvObservationSource::Fetch(const std::string& airport_code,
                                                                                 const std::string& station_id,
                                                                                 const std::string& start_date,
                                                                                 const std::string& end_date) {
  std::vector<db::model::WeatherObservationRecord> observations;

  const auto key = weather_prefix_ + station_id + ".csv";
  if (!store_->Exists(key)) {
    FLIGHTLINE_LOG_WARN("no observations for station",
                        {observability::StringField("airport", airport_code), observability::StringField("station", station_id),
                         observability::StringField("key", key)});
    return observations;
  }

  storage::csv::CsvReadSpec spec;
  spec.columns     = AsosColumns();
  spec.null_values = {"", "M", "T"};

  storage::csv::ChunkedCsvReader reader(*store_, key, spec);
  storage::csv::CsvChunk         chunk;
  while (reader.Next(chunk)) {
    for (const auto& row : chunk.rows) {
      auto obs = ParseAsosRow(row, airport_code);
      if (!obs || obs->observation_date < start_date || obs->observation_date > end_date) {
        continue;
      }
      observations.push_back(std::move(*obs));
    }
  }

  FLIGHTLINE_LOG_DEBUG("station observations read", {observability::StringField("station", station_id),
                                                     observability::IntField("observations", static_cast<int64_t>(observations.size()))});
  return observations;
}

} // namespace flightline::weather
