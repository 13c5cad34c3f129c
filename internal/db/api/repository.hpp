#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/airport_record.hpp"
#include "internal/db/model/carrier_record.hpp"
#include "internal/db/model/date_record.hpp"
#include "internal/db/model/flight_record.hpp"
#include "internal/db/model/flight_summary.hpp"
#include "internal/db/model/pipeline_run_record.hpp"
#include "internal/db/model/rejected_record.hpp"
#include "internal/db/model/weather_record.hpp"

namespace flightline::db {

enum class Table {
  PipelineRuns,
  Airports,
  Carriers,
  DateDim,
  Flights,
  RejectedRecords,
  WeatherObservations,
};

inline const char* TableName(Table table) {
  switch (table) {
    case Table::PipelineRuns: return "pipeline_runs";
    case Table::Airports: return "airports";
    case Table::Carriers: return "carriers";
    case Table::DateDim: return "date_dim";
    case Table::Flights: return "flights";
    case Table::RejectedRecords: return "rejected_records";
    case Table::WeatherObservations: return "weather_observations";
  }
  return "";
}

enum class FlightEndpoint {
  Origin,
  Destination,
};

/*
  Warehouse repository.

  CRITICAL GUARANTEES:

  - Every call runs inside a caller-owned Transaction
  - Reads inside a transaction see its own writes
  - Dimension, fact and weather inserts are conflict-do-nothing on the
    natural key; existing rows are never modified
  - Ledger rows are upserted on (file_name, source)

  Writes report failures through Result. Reads throw std::runtime_error
  (or a driver exception derived from it) when the backend fails.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual Result UpsertPipelineRun(Transaction&, const model::PipelineRunRecord&) = 0;

  virtual std::optional<model::PipelineRunRecord> GetPipelineRun(Transaction&, const std::string& file_name,
                                                                 const std::string& source) = 0;

  // file names with status completed for source, ascending
  virtual std::vector<std::string> ListCompletedFiles(Transaction&, const std::string& source) = 0;

  // most recent completed row for source by completed_at
  virtual std::optional<model::PipelineRunRecord> GetLatestCompletedRun(Transaction&, const std::string& source) = 0;

  // ---------------------------------------------------------------------
  // Dimensions
  // ---------------------------------------------------------------------

  virtual Result InsertAirports(Transaction&, const std::vector<model::AirportRecord>&) = 0;

  virtual std::optional<model::AirportRecord> GetAirport(Transaction&, const std::string& airport_code) = 0;

  virtual std::vector<std::string> ListAirportCodes(Transaction&) = 0;

  virtual Result InsertCarriers(Transaction&, const std::vector<model::CarrierRecord>&) = 0;

  virtual std::optional<model::CarrierRecord> GetCarrier(Transaction&, const std::string& carrier_code) = 0;

  virtual std::vector<std::string> ListCarrierCodes(Transaction&) = 0;

  virtual Result InsertDates(Transaction&, const std::vector<model::DateRecord>&) = 0;

  virtual std::optional<model::DateRecord> GetDate(Transaction&, const std::string& date_id) = 0;

  // date_id values, ascending
  virtual std::vector<std::string> ListDates(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Facts
  // ---------------------------------------------------------------------

  virtual Result InsertFlights(Transaction&, const std::vector<model::FlightRecord>&) = 0;

  virtual std::optional<model::FlightRecord> GetFlight(Transaction&, const model::FlightKey&) = 0;

  virtual Result AppendRejectedRecords(Transaction&, const std::vector<model::RejectedRecord>&) = 0;

  virtual std::vector<model::RejectedRecord> ListRejectedRecords(Transaction&, const std::string& source,
                                                                 const std::string& file_name) = 0;

  // ---------------------------------------------------------------------
  // Weather
  // ---------------------------------------------------------------------

  virtual std::vector<model::WeatherKey> ListWeatherKeys(Transaction&) = 0;

  virtual Result InsertWeatherObservations(Transaction&, const std::vector<model::WeatherObservationRecord>&) = 0;

  // ---------------------------------------------------------------------
  // Aggregates (quality gate)
  // ---------------------------------------------------------------------

  virtual uint64_t CountRows(Transaction&, Table) = 0;

  // flights whose origin or destination has no airports row
  virtual uint64_t CountOrphanFlights(Transaction&, FlightEndpoint) = 0;

  // flights with arr_delay or dep_delay outside [floor, ceiling]
  virtual uint64_t CountDelaysOutOfRange(Transaction&, double floor, double ceiling) = 0;

  // distinct weather airports present in airports
  virtual uint64_t CountWeatherAirportsInDimension(Transaction&) = 0;

  // distinct weather dates present in date_dim
  virtual uint64_t CountWeatherDatesInDimension(Transaction&) = 0;

  virtual model::FlightSummary SummarizeFlights(Transaction&) = 0;
};

} // namespace flightline::db
