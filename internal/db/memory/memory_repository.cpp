#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace flightline::db::memory {

namespace {

bool OutOfRange(const std::optional<double>& value, double floor, double ceiling) {
  return value.has_value() && (*value < floor || *value > ceiling);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPipelineRun(Transaction& t, const model::PipelineRunRecord& r) {
  if (r.file_name.empty() || r.source.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "pipeline run requires file_name and source");
  }
  TX(t).Mutable().runs[{r.file_name, r.source}] = r;
  return Result::Ok();
}

std::optional<model::PipelineRunRecord> MemoryRepository::GetPipelineRun(Transaction& t, const std::string& file_name,
                                                                         const std::string& source) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find({file_name, source});
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryRepository::ListCompletedFiles(Transaction& t, const std::string& source) {
  std::vector<std::string> files;
  for (const auto& [key, run] : TX(t).View().runs) {
    if (key.second == source && run.status == model::RunStatus::Completed) {
      files.push_back(key.first);
    }
  }
  return files;
}

std::optional<model::PipelineRunRecord> MemoryRepository::GetLatestCompletedRun(Transaction& t, const std::string& source) {
  std::optional<model::PipelineRunRecord> latest;
  for (const auto& [key, run] : TX(t).View().runs) {
    if (key.second != source || run.status != model::RunStatus::Completed) continue;
    if (!latest || run.completed_at_ms >= latest->completed_at_ms) {
      latest = run;
    }
  }
  return latest;
}

// ------------------------------------------------------------------
// Dimensions
// ------------------------------------------------------------------

Result MemoryRepository::InsertAirports(Transaction& t, const std::vector<model::AirportRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.airports.try_emplace(r.airport_code, r);
  }
  return Result::Ok();
}

std::optional<model::AirportRecord> MemoryRepository::GetAirport(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.airports.find(code);
  if (it == s.airports.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryRepository::ListAirportCodes(Transaction& t) {
  std::vector<std::string> codes;
  for (const auto& [code, _] : TX(t).View().airports) codes.push_back(code);
  return codes;
}

Result MemoryRepository::InsertCarriers(Transaction& t, const std::vector<model::CarrierRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.carriers.try_emplace(r.carrier_code, r);
  }
  return Result::Ok();
}

std::optional<model::CarrierRecord> MemoryRepository::GetCarrier(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.carriers.find(code);
  if (it == s.carriers.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryRepository::ListCarrierCodes(Transaction& t) {
  std::vector<std::string> codes;
  for (const auto& [code, _] : TX(t).View().carriers) codes.push_back(code);
  return codes;
}

Result MemoryRepository::InsertDates(Transaction& t, const std::vector<model::DateRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.dates.try_emplace(r.date_id, r);
  }
  return Result::Ok();
}

std::optional<model::DateRecord> MemoryRepository::GetDate(Transaction& t, const std::string& date_id) {
  const auto& s  = TX(t).View();
  auto        it = s.dates.find(date_id);
  if (it == s.dates.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> MemoryRepository::ListDates(Transaction& t) {
  std::vector<std::string> dates;
  for (const auto& [date_id, _] : TX(t).View().dates) dates.push_back(date_id);
  return dates;
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlights(Transaction& t, const std::vector<model::FlightRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.flights.try_emplace(r.Key(), r);
  }
  return Result::Ok();
}

std::optional<model::FlightRecord> MemoryRepository::GetFlight(Transaction& t, const model::FlightKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.flights.find(key);
  if (it == s.flights.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::AppendRejectedRecords(Transaction& t, const std::vector<model::RejectedRecord>& records) {
  auto& rejected = TX(t).Mutable().rejected;
  rejected.insert(rejected.end(), records.begin(), records.end());
  return Result::Ok();
}

std::vector<model::RejectedRecord> MemoryRepository::ListRejectedRecords(Transaction& t, const std::string& source,
                                                                         const std::string& file_name) {
  std::vector<model::RejectedRecord> out;
  for (const auto& r : TX(t).View().rejected) {
    if (r.source == source && r.file_name == file_name) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Weather
// ------------------------------------------------------------------

std::vector<model::WeatherKey> MemoryRepository::ListWeatherKeys(Transaction& t) {
  std::vector<model::WeatherKey> keys;
  for (const auto& [key, _] : TX(t).View().weather) keys.push_back(key);
  return keys;
}

Result MemoryRepository::InsertWeatherObservations(Transaction& t, const std::vector<model::WeatherObservationRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    s.weather.try_emplace(r.Key(), r);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Aggregates
// ------------------------------------------------------------------

uint64_t MemoryRepository::CountRows(Transaction& t, Table table) {
  const auto& s = TX(t).View();
  switch (table) {
    case Table::PipelineRuns: return s.runs.size();
    case Table::Airports: return s.airports.size();
    case Table::Carriers: return s.carriers.size();
    case Table::DateDim: return s.dates.size();
    case Table::Flights: return s.flights.size();
    case Table::RejectedRecords: return s.rejected.size();
    case Table::WeatherObservations: return s.weather.size();
  }
  return 0;
}

uint64_t MemoryRepository::CountOrphanFlights(Transaction& t, FlightEndpoint endpoint) {
  const auto& s = TX(t).View();
  return std::count_if(s.flights.begin(), s.flights.end(), [&](const auto& entry) {
    const auto& code = endpoint == FlightEndpoint::Origin ? entry.second.origin_airport : entry.second.dest_airport;
    return !s.airports.contains(code);
  });
}

uint64_t MemoryRepository::CountDelaysOutOfRange(Transaction& t, double floor, double ceiling) {
  const auto& s = TX(t).View();
  return std::count_if(s.flights.begin(), s.flights.end(), [&](const auto& entry) {
    return OutOfRange(entry.second.arr_delay, floor, ceiling) || OutOfRange(entry.second.dep_delay, floor, ceiling);
  });
}

uint64_t MemoryRepository::CountWeatherAirportsInDimension(Transaction& t) {
  const auto&           s = TX(t).View();
  std::set<std::string> airports;
  for (const auto& [key, _] : s.weather) {
    if (s.airports.contains(key.airport_code)) airports.insert(key.airport_code);
  }
  return airports.size();
}

uint64_t MemoryRepository::CountWeatherDatesInDimension(Transaction& t) {
  const auto&           s = TX(t).View();
  std::set<std::string> dates;
  for (const auto& [_, observation] : s.weather) {
    if (s.dates.contains(observation.observation_date)) dates.insert(observation.observation_date);
  }
  return dates.size();
}

model::FlightSummary MemoryRepository::SummarizeFlights(Transaction& t) {
  const auto& s = TX(t).View();

  model::FlightSummary  summary;
  std::set<std::string> carriers;
  std::set<std::string> origins;
  std::set<std::string> destinations;
  double                delay_sum   = 0.0;
  uint64_t              delay_count = 0;

  for (const auto& [_, flight] : s.flights) {
    ++summary.total_flights;
    carriers.insert(flight.carrier_code);
    origins.insert(flight.origin_airport);
    destinations.insert(flight.dest_airport);
    if (flight.cancelled) ++summary.cancellations;
    if (flight.arr_delay) {
      delay_sum += *flight.arr_delay;
      ++delay_count;
    }
  }

  summary.distinct_carriers     = carriers.size();
  summary.distinct_origins      = origins.size();
  summary.distinct_destinations = destinations.size();
  if (delay_count > 0) summary.avg_arr_delay = delay_sum / static_cast<double>(delay_count);
  return summary;
}

} // namespace flightline::db::memory
