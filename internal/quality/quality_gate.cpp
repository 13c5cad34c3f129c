#include "quality_gate.hpp"

#include <sstream>

#include "internal/ledger/ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace flightline::quality {

namespace {

void Record(QualityReport& report, std::string name, bool passed, std::string detail) {
  if (passed) {
    ++report.passed;
  } else {
    ++report.failed;
  }
  report.checks.push_back({std::move(name), passed, std::move(detail)});
}

void NonEmpty(QualityReport& report, db::Repository& repo, db::Transaction& tx, db::Table table) {
  const auto count = repo.CountRows(tx, table);
  Record(report, std::string(db::TableName(table)) + "_not_empty", count > 0, std::to_string(count) + " rows");
}

void Zero(QualityReport& report, std::string name, uint64_t count, const std::string& what) {
  Record(report, std::move(name), count == 0, std::to_string(count) + " " + what);
}

} // namespace

QualityGate::QualityGate(std::shared_ptr<db::Repository> repo, QualityThresholds thresholds)
    : repo_(std::move(repo)), thresholds_(thresholds) {
}

QualityReport QualityGate::Evaluate() {
  QualityReport report;

  auto tx = repo_->Begin();

  NonEmpty(report, *repo_, *tx, db::Table::Airports);
  NonEmpty(report, *repo_, *tx, db::Table::Carriers);
  NonEmpty(report, *repo_, *tx, db::Table::DateDim);
  NonEmpty(report, *repo_, *tx, db::Table::Flights);

  Zero(report, "origin_airports_resolved", repo_->CountOrphanFlights(*tx, db::FlightEndpoint::Origin),
       "flights with unknown origin airport");
  Zero(report, "dest_airports_resolved", repo_->CountOrphanFlights(*tx, db::FlightEndpoint::Destination),
       "flights with unknown dest airport");

  std::ostringstream range;
  range << "flights with delays outside [" << thresholds_.delay_floor << ", " << thresholds_.delay_ceiling << "]";
  Zero(report, "delays_in_range", repo_->CountDelaysOutOfRange(*tx, thresholds_.delay_floor, thresholds_.delay_ceiling),
       range.str());

  auto latest = repo_->GetLatestCompletedRun(*tx, ledger::kFlightsSource);
  if (!latest) {
    Record(report, "rejection_rate", false, "no completed flights run");
  } else {
    const auto   total = latest->rows_loaded + latest->rows_rejected;
    const double rate  = total == 0 ? 0.0 : static_cast<double>(latest->rows_rejected) / static_cast<double>(total);

    std::ostringstream detail;
    detail << latest->file_name << ": " << latest->rows_rejected << "/" << total << " rejected (" << rate * 100.0
           << "%, limit " << thresholds_.max_rejection_rate * 100.0 << "%)";
    Record(report, "rejection_rate", rate < thresholds_.max_rejection_rate, detail.str());
  }

  NonEmpty(report, *repo_, *tx, db::Table::WeatherObservations);

  const auto weather_airports = repo_->CountWeatherAirportsInDimension(*tx);
  Record(report, "weather_airports_known", weather_airports > 0, std::to_string(weather_airports) + " airports with weather");

  const auto weather_dates = repo_->CountWeatherDatesInDimension(*tx);
  Record(report, "weather_dates_known", weather_dates > 0, std::to_string(weather_dates) + " dates with weather");

  report.summary = repo_->SummarizeFlights(*tx);
  tx->Commit();

  return report;
}

QualityReport QualityGate::Run() {
  observability::SpanScope span("quality.gate");

  auto report = Evaluate();

  for (const auto& check : report.checks) {
    if (check.passed) {
      FLIGHTLINE_LOG_INFO("quality check passed",
                          {observability::StringField("check", check.name), observability::StringField("detail", check.detail)});
    } else {
      FLIGHTLINE_LOG_ERROR("quality check failed",
                           {observability::StringField("check", check.name), observability::StringField("detail", check.detail)});
    }
  }

  const auto& s = report.summary;
  FLIGHTLINE_LOG_INFO("dataset summary", {observability::IntField("flights", static_cast<int64_t>(s.total_flights)),
                                          observability::IntField("carriers", static_cast<int64_t>(s.distinct_carriers)),
                                          observability::IntField("origins", static_cast<int64_t>(s.distinct_origins)),
                                          observability::IntField("destinations", static_cast<int64_t>(s.distinct_destinations)),
                                          s.avg_arr_delay ? observability::DoubleField("avg_arr_delay", *s.avg_arr_delay)
                                                          : observability::StringField("avg_arr_delay", "n/a"),
                                          observability::IntField("cancellations", static_cast<int64_t>(s.cancellations))});

  span.SetAttribute("passed", static_cast<int64_t>(report.passed));
  span.SetAttribute("failed", static_cast<int64_t>(report.failed));
  FLIGHTLINE_LOG_INFO("quality checks finished", {observability::IntField("passed", static_cast<int64_t>(report.passed)),
                                                  observability::IntField("failed", static_cast<int64_t>(report.failed))});

  if (!report.Passed()) {
    throw util::QualityGateFailure(std::to_string(report.failed) + " quality checks failed");
  }
  return report;
}

} // namespace flightline::quality
