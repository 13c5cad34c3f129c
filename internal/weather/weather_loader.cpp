#include "weather_loader.hpp"

#include <set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace flightline::weather {

WeatherLoader::WeatherLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<ObservationSource> source,
                             std::shared_ptr<ledger::Ledger> ledger, std::map<std::string, std::string> airport_stations,
                             std::string source_name)
    : repo_(std::move(repo)),
      source_(std::move(source)),
      ledger_(std::move(ledger)),
      airport_stations_(std::move(airport_stations)),
      source_name_(std::move(source_name)) {
}

WeatherLoadResult WeatherLoader::Run() {
  observability::SpanScope span("weather.load");

  std::set<std::string>          warehouse_airports;
  std::set<std::string>          dates;
  std::set<db::model::WeatherKey> seen;
  {
    auto tx = repo_->Begin();
    for (auto& code : repo_->ListAirportCodes(*tx)) {
      warehouse_airports.insert(std::move(code));
    }
    for (auto& date : repo_->ListDates(*tx)) {
      dates.insert(std::move(date));
    }
    for (auto& key : repo_->ListWeatherKeys(*tx)) {
      seen.insert(std::move(key));
    }
    tx->Commit();
  }

  WeatherLoadResult result;

  std::vector<std::pair<std::string, std::string>> targets;
  for (const auto& [airport, station] : airport_stations_) {
    if (warehouse_airports.contains(airport)) {
      targets.emplace_back(airport, station);
    }
  }
  result.airports = targets.size();
  result.dates    = dates.size();

  if (targets.empty() || dates.empty()) {
    FLIGHTLINE_LOG_WARN("no weather to load", {observability::IntField("airports", static_cast<int64_t>(result.airports)),
                                               observability::IntField("dates", static_cast<int64_t>(result.dates))});
    return result;
  }

  FLIGHTLINE_LOG_INFO("weather load started", {observability::IntField("airports", static_cast<int64_t>(result.airports)),
                                               observability::StringField("first_date", *dates.begin()),
                                               observability::StringField("last_date", *dates.rbegin()),
                                               observability::IntField("existing", static_cast<int64_t>(seen.size()))});

  auto run = ledger_->Begin(source_name_, ledger::kWeatherSource);

  try {
    std::vector<db::model::WeatherObservationRecord> batch;
    for (const auto& [airport, station] : targets) {
      auto observations = source_->Fetch(airport, station, *dates.begin(), *dates.rbegin());
      for (auto& obs : observations) {
        if (!dates.contains(obs.observation_date)) {
          continue;
        }
        ++result.fetched;
        if (!seen.insert(obs.Key()).second) {
          ++result.skipped;
          continue;
        }
        batch.push_back(std::move(obs));
      }
    }

    if (!batch.empty()) {
      auto tx = repo_->Begin();
      util::ThrowIfDbError(repo_->InsertWeatherObservations(*tx, batch), "insert weather observations");
      tx->Commit();
    }
    result.loaded = batch.size();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    ledger_->Fail(run, e.what());
    throw;
  }

  run.rows_processed = result.loaded;
  run.rows_loaded    = result.loaded;
  run.rows_rejected  = 0;
  ledger_->Complete(run);

  observability::Metrics::Instance().AddRows(ledger::kWeatherSource, result.loaded, 0);
  FLIGHTLINE_LOG_INFO("weather loaded", {observability::IntField("fetched", static_cast<int64_t>(result.fetched)),
                                         observability::IntField("loaded", static_cast<int64_t>(result.loaded)),
                                         observability::IntField("skipped", static_cast<int64_t>(result.skipped))});
  return result;
}

} // namespace flightline::weather
