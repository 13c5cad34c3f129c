#include "internal/weather/weather_loader.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dimension/date_dim.hpp"
#include "internal/weather/asos_csv_source.hpp"
#include "support/fixtures.hpp"

namespace {

using flightline::db::Table;
using flightline::db::memory::MemoryRepository;
using flightline::db::model::RunStatus;
using flightline::db::model::WeatherObservationRecord;
using flightline::ledger::Ledger;
using flightline::testing::LocalStore;
using flightline::testing::TempDir;
using flightline::weather::AsosCsvObservationSource;
using flightline::weather::ObservationSource;
using flightline::weather::WeatherLoader;

WeatherObservationRecord Obs(const std::string& airport, const std::string& time, double temp) {
  WeatherObservationRecord obs;
  obs.airport_code     = airport;
  obs.observation_date = time.substr(0, 10);
  obs.observation_time = time;
  obs.avg_temperature  = temp;
  return obs;
}

// Serves a fixed observation set per station and records the requested range.
class FakeSource final : public ObservationSource {
 public:
  std::map<std::string, std::vector<WeatherObservationRecord>> by_station;
  std::vector<std::string>                                     calls;
  std::string                                                  last_start;
  std::string                                                  last_end;
  bool                                                         fail = false;

  std::vector<WeatherObservationRecord> Fetch(const std::string& airport_code, const std::string& station_id,
                                              const std::string& start_date, const std::string& end_date) override {
    if (fail) {
      throw std::runtime_error("station feed unavailable");
    }
    calls.push_back(airport_code + "/" + station_id);
    last_start = start_date;
    last_end   = end_date;

    std::vector<WeatherObservationRecord> out;
    for (auto obs : by_station[station_id]) {
      obs.airport_code = airport_code;
      out.push_back(std::move(obs));
    }
    return out;
  }
};

struct Harness {
  TempDir                           dir{"weather_loader"};
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<Ledger>           ledger = std::make_shared<Ledger>(repo, LocalStore(dir.path()), "raw/");
  std::shared_ptr<FakeSource>       source = std::make_shared<FakeSource>();

  std::map<std::string, std::string> stations = {{"ATL", "KATL"}, {"ORD", "KORD"}, {"JFK", "KJFK"}};

  Harness() {
    flightline::testing::SeedAirports(*repo, {"ATL", "ORD"});
    (void)flightline::dimension::EnsureDates(*repo, {"2024-01-15", "2024-01-16"});
  }

  WeatherLoader Loader() {
    return WeatherLoader(repo, source, ledger, stations, "asos_hourly_weather");
  }

  uint64_t Count(Table table) {
    auto tx = repo->Begin();
    auto n  = repo->CountRows(*tx, table);
    tx->Commit();
    return n;
  }

  flightline::db::model::PipelineRunRecord LedgerRow() {
    auto tx  = repo->Begin();
    auto run = repo->GetPipelineRun(*tx, "asos_hourly_weather", "weather");
    tx->Commit();
    assert(run.has_value());
    return *run;
  }
};

void TestLoadsOnlyWarehouseAirportsAndDates() {
  Harness h;
  h.source->by_station["KATL"] = {Obs("", "2024-01-15 00:52", 41.0), Obs("", "2024-01-15 01:52", 40.0),
                                  Obs("", "2024-01-17 00:52", 39.0)};
  h.source->by_station["KORD"] = {Obs("", "2024-01-16 12:51", 20.0)};

  const auto result = h.Loader().Run();

  assert(result.airports == 2);
  assert(result.dates == 2);
  assert(result.fetched == 3);
  assert(result.loaded == 3);
  assert(result.skipped == 0);
  assert(h.source->calls == (std::vector<std::string>{"ATL/KATL", "ORD/KORD"}));
  assert(h.source->last_start == "2024-01-15");
  assert(h.source->last_end == "2024-01-16");

  assert(h.Count(Table::WeatherObservations) == 3);
  const auto run = h.LedgerRow();
  assert(run.status == RunStatus::Completed);
  assert(run.rows_processed == 3);
  assert(run.rows_loaded == 3);
  assert(run.rows_rejected == 0);
}

void TestOverlappingRerunAddsNoDuplicates() {
  Harness h;
  h.source->by_station["KATL"] = {Obs("", "2024-01-15 00:52", 41.0), Obs("", "2024-01-15 01:52", 40.0)};
  (void)h.Loader().Run();

  // regenerated feed: two known pairs with new values, one new pair, one in-batch repeat
  h.source->by_station["KATL"] = {Obs("", "2024-01-15 00:52", 50.0), Obs("", "2024-01-15 01:52", 51.0),
                                  Obs("", "2024-01-16 02:52", 38.0), Obs("", "2024-01-16 02:52", 37.0)};
  const auto again = h.Loader().Run();

  assert(again.fetched == 4);
  assert(again.loaded == 1);
  assert(again.skipped == 3);
  assert(h.Count(Table::WeatherObservations) == 3);

  auto tx   = h.repo->Begin();
  auto keys = h.repo->ListWeatherKeys(*tx);
  tx->Commit();
  assert(keys.size() == 3);
}

void TestNothingToLoadWritesNoLedgerRow() {
  Harness h;
  h.stations = {{"LAX", "KLAX"}};

  const auto result = h.Loader().Run();
  assert(result.airports == 0);
  assert(result.loaded == 0);
  assert(h.source->calls.empty());

  auto tx  = h.repo->Begin();
  auto run = h.repo->GetPipelineRun(*tx, "asos_hourly_weather", "weather");
  tx->Commit();
  assert(!run.has_value());
}

void TestSourceFailureMarksLedgerFailed() {
  Harness h;
  h.source->fail = true;

  bool threw = false;
  try {
    (void)h.Loader().Run();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(h.LedgerRow().status == RunStatus::Failed);
  assert(h.Count(Table::WeatherObservations) == 0);
}

void TestConditions() {
  using flightline::weather::DetermineConditions;

  WeatherObservationRecord obs;
  assert(DetermineConditions(obs) == "Clear");

  obs.avg_temperature = 20.0;
  assert(DetermineConditions(obs) == "Cold/Clear");

  obs.precipitation = 0.02;
  assert(DetermineConditions(obs) == "Snow");

  obs.avg_temperature = 45.0;
  assert(DetermineConditions(obs) == "Light Rain");

  obs.precipitation = 0.3;
  assert(DetermineConditions(obs) == "Rain");

  obs.precipitation  = std::nullopt;
  obs.avg_visibility = 1.5;
  assert(DetermineConditions(obs) == "Fog/Low Visibility");
}

void TestObservationTime() {
  using flightline::weather::NormalizeObservationTime;

  assert(NormalizeObservationTime("2024-01-15 13:51") == std::optional<std::string>("2024-01-15 13:51"));
  assert(NormalizeObservationTime("2024-01-15 13:51:00") == std::optional<std::string>("2024-01-15 13:51"));
  assert(NormalizeObservationTime("2024-01-15") == std::optional<std::string>("2024-01-15 00:00"));
  assert(!NormalizeObservationTime("2024-02-30 10:00"));
  assert(!NormalizeObservationTime("2024-01-15 1:5"));
}

void TestAsosRowParsing() {
  flightline::storage::csv::CsvRow row = {"ATL", "2024-01-15 00:52", "41.0", "30.0", "64.5", "10", "9.00", std::nullopt};

  auto obs = flightline::weather::ParseAsosRow(row, "ATL");
  assert(obs.has_value());
  assert(obs->observation_date == "2024-01-15");
  assert(obs->observation_time == "2024-01-15 00:52");
  assert(obs->avg_temperature == std::optional<double>(41.0));
  assert(obs->dew_point == std::optional<double>(30.0));
  assert(obs->humidity == std::optional<double>(64.5));
  assert(obs->avg_wind_speed == std::optional<double>(11.5));
  assert(!obs->precipitation);
  assert(obs->conditions == std::optional<std::string>("Clear"));

  row[1] = std::nullopt;
  assert(!flightline::weather::ParseAsosRow(row, "ATL"));
}

void TestAsosCsvSourceReadsStationFile() {
  TempDir dir("asos_source");
  auto    store = LocalStore(dir.path());
  store->Write("weather/KATL.csv",
               "station,valid,tmpf,dwpf,relh,sknt,vsby,p01i\n"
               "ATL,2024-01-14 23:52,40.0,30.0,60.0,5,10.00,0.00\n"
               "ATL,2024-01-15 00:52,28.0,20.0,70.0,M,0.50,T\n"
               "ATL,2024-01-15 01:52,M,M,M,8,10.00,0.15\n"
               "ATL,2024-01-16 00:52,45.0,40.0,80.0,0,10.00,0.00\n");

  AsosCsvObservationSource source(store, "weather/");
  auto observations = source.Fetch("ATL", "KATL", "2024-01-15", "2024-01-15");

  assert(observations.size() == 2);
  assert(observations[0].airport_code == "ATL");
  assert(observations[0].observation_time == "2024-01-15 00:52");
  assert(!observations[0].avg_wind_speed);
  assert(!observations[0].precipitation);
  assert(observations[0].conditions == std::optional<std::string>("Fog/Low Visibility"));
  assert(!observations[1].avg_temperature);
  assert(observations[1].conditions == std::optional<std::string>("Rain"));

  assert(source.Fetch("ORD", "KORD", "2024-01-15", "2024-01-16").empty());
}

} // namespace

int main() {
  TestLoadsOnlyWarehouseAirportsAndDates();
  TestOverlappingRerunAddsNoDuplicates();
  TestNothingToLoadWritesNoLedgerRow();
  TestSourceFailureMarksLedgerFailed();
  TestConditions();
  TestObservationTime();
  TestAsosRowParsing();
  TestAsosCsvSourceReadsStationFile();

  std::cout << "flightline_unit_weather_loader: pass\n";
  return 0;
}
