#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flightline::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertPipelineRun(Transaction&, const model::PipelineRunRecord&) override;
  std::optional<model::PipelineRunRecord> GetPipelineRun(Transaction&, const std::string& file_name,
                                                         const std::string& source) override;
  std::vector<std::string> ListCompletedFiles(Transaction&, const std::string& source) override;
  std::optional<model::PipelineRunRecord> GetLatestCompletedRun(Transaction&, const std::string& source) override;

  Result InsertAirports(Transaction&, const std::vector<model::AirportRecord>&) override;
  std::optional<model::AirportRecord> GetAirport(Transaction&, const std::string&) override;
  std::vector<std::string> ListAirportCodes(Transaction&) override;

  Result InsertCarriers(Transaction&, const std::vector<model::CarrierRecord>&) override;
  std::optional<model::CarrierRecord> GetCarrier(Transaction&, const std::string&) override;
  std::vector<std::string> ListCarrierCodes(Transaction&) override;

  Result InsertDates(Transaction&, const std::vector<model::DateRecord>&) override;
  std::optional<model::DateRecord> GetDate(Transaction&, const std::string&) override;
  std::vector<std::string> ListDates(Transaction&) override;

  Result InsertFlights(Transaction&, const std::vector<model::FlightRecord>&) override;
  std::optional<model::FlightRecord> GetFlight(Transaction&, const model::FlightKey&) override;
  Result AppendRejectedRecords(Transaction&, const std::vector<model::RejectedRecord>&) override;
  std::vector<model::RejectedRecord> ListRejectedRecords(Transaction&, const std::string& source,
                                                         const std::string& file_name) override;

  std::vector<model::WeatherKey> ListWeatherKeys(Transaction&) override;
  Result InsertWeatherObservations(Transaction&, const std::vector<model::WeatherObservationRecord>&) override;

  uint64_t CountRows(Transaction&, Table) override;
  uint64_t CountOrphanFlights(Transaction&, FlightEndpoint) override;
  uint64_t CountDelaysOutOfRange(Transaction&, double floor, double ceiling) override;
  uint64_t CountWeatherAirportsInDimension(Transaction&) override;
  uint64_t CountWeatherDatesInDimension(Transaction&) override;
  model::FlightSummary SummarizeFlights(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace flightline::db::sqlite
