#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flightline::testing {

/*
  Repository decorator that injects write failures.

  fail_flight_insert_at: 1-based InsertFlights call that returns
  IOError (0 = never). fail_ledger: every UpsertPipelineRun fails.
*/
class FaultyRepository final : public db::Repository {
 public:
  explicit FaultyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  uint64_t fail_flight_insert_at = 0;
  bool     fail_ledger           = false;
  uint64_t flight_insert_calls   = 0;

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result UpsertPipelineRun(db::Transaction& tx, const db::model::PipelineRunRecord& run) override {
    if (fail_ledger) {
      return db::Result::Err(db::ErrorCode::IOError, "injected ledger failure");
    }
    return inner_->UpsertPipelineRun(tx, run);
  }

  std::optional<db::model::PipelineRunRecord> GetPipelineRun(db::Transaction& tx, const std::string& file_name,
                                                             const std::string& source) override {
    return inner_->GetPipelineRun(tx, file_name, source);
  }

  std::vector<std::string> ListCompletedFiles(db::Transaction& tx, const std::string& source) override {
    return inner_->ListCompletedFiles(tx, source);
  }

  std::optional<db::model::PipelineRunRecord> GetLatestCompletedRun(db::Transaction& tx, const std::string& source) override {
    return inner_->GetLatestCompletedRun(tx, source);
  }

  db::Result InsertAirports(db::Transaction& tx, const std::vector<db::model::AirportRecord>& records) override {
    return inner_->InsertAirports(tx, records);
  }

  std::optional<db::model::AirportRecord> GetAirport(db::Transaction& tx, const std::string& code) override {
    return inner_->GetAirport(tx, code);
  }

  std::vector<std::string> ListAirportCodes(db::Transaction& tx) override {
    return inner_->ListAirportCodes(tx);
  }

  db::Result InsertCarriers(db::Transaction& tx, const std::vector<db::model::CarrierRecord>& records) override {
    return inner_->InsertCarriers(tx, records);
  }

  std::optional<db::model::CarrierRecord> GetCarrier(db::Transaction& tx, const std::string& code) override {
    return inner_->GetCarrier(tx, code);
  }

  std::vector<std::string> ListCarrierCodes(db::Transaction& tx) override {
    return inner_->ListCarrierCodes(tx);
  }

  db::Result InsertDates(db::Transaction& tx, const std::vector<db::model::DateRecord>& records) override {
    return inner_->InsertDates(tx, records);
  }

  std::optional<db::model::DateRecord> GetDate(db::Transaction& tx, const std::string& date_id) override {
    return inner_->GetDate(tx, date_id);
  }

  std::vector<std::string> ListDates(db::Transaction& tx) override {
    return inner_->ListDates(tx);
  }

  db::Result InsertFlights(db::Transaction& tx, const std::vector<db::model::FlightRecord>& records) override {
    ++flight_insert_calls;
    if (fail_flight_insert_at != 0 && flight_insert_calls == fail_flight_insert_at) {
      return db::Result::Err(db::ErrorCode::IOError, "injected flight insert failure");
    }
    return inner_->InsertFlights(tx, records);
  }

  std::optional<db::model::FlightRecord> GetFlight(db::Transaction& tx, const db::model::FlightKey& key) override {
    return inner_->GetFlight(tx, key);
  }

  db::Result AppendRejectedRecords(db::Transaction& tx, const std::vector<db::model::RejectedRecord>& records) override {
    return inner_->AppendRejectedRecords(tx, records);
  }

  std::vector<db::model::RejectedRecord> ListRejectedRecords(db::Transaction& tx, const std::string& source,
                                                             const std::string& file_name) override {
    return inner_->ListRejectedRecords(tx, source, file_name);
  }

  std::vector<db::model::WeatherKey> ListWeatherKeys(db::Transaction& tx) override {
    return inner_->ListWeatherKeys(tx);
  }

  db::Result InsertWeatherObservations(db::Transaction& tx,
                                       const std::vector<db::model::WeatherObservationRecord>& records) override {
    return inner_->InsertWeatherObservations(tx, records);
  }

  uint64_t CountRows(db::Transaction& tx, db::Table table) override {
    return inner_->CountRows(tx, table);
  }

  uint64_t CountOrphanFlights(db::Transaction& tx, db::FlightEndpoint endpoint) override {
    return inner_->CountOrphanFlights(tx, endpoint);
  }

  uint64_t CountDelaysOutOfRange(db::Transaction& tx, double floor, double ceiling) override {
    return inner_->CountDelaysOutOfRange(tx, floor, ceiling);
  }

  uint64_t CountWeatherAirportsInDimension(db::Transaction& tx) override {
    return inner_->CountWeatherAirportsInDimension(tx);
  }

  uint64_t CountWeatherDatesInDimension(db::Transaction& tx) override {
    return inner_->CountWeatherDatesInDimension(tx);
  }

  db::model::FlightSummary SummarizeFlights(db::Transaction& tx) override {
    return inner_->SummarizeFlights(tx);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace flightline::testing
