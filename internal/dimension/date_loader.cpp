#include "date_loader.hpp"

#include "internal/dimension/date_dim.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/storage/csv/csv_reader.hpp"

namespace flightline::dimension {

std::set<std::string> ScanFlightDates(storage::ObjectStore& store, const std::string& key, std::size_t chunk_rows) {
  storage::csv::CsvReadSpec spec;
  spec.columns    = {"FlightDate"};
  spec.chunk_rows = chunk_rows;

  std::set<std::string>          dates;
  storage::csv::ChunkedCsvReader reader(store, key, spec);
  storage::csv::CsvChunk         chunk;
  while (reader.Next(chunk)) {
    for (const auto& row : chunk.rows) {
      if (!row[0]) {
        continue;
      }
      if (auto date = NormalizeDate(*row[0])) {
        dates.insert(std::move(*date));
      }
    }
  }
  return dates;
}

DateLoader::DateLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                       std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_rows)
    : repo_(std::move(repo)), store_(std::move(store)), ledger_(std::move(ledger)), chunk_rows_(chunk_rows) {
}

std::set<std::string> DateLoader::CollectDates() {
  std::set<std::string> dates;
  for (const auto& key : ledger_->PendingFiles(ledger::kFlightsSource)) {
    auto file_dates = ScanFlightDates(*store_, key, chunk_rows_);
    FLIGHTLINE_LOG_DEBUG("dates scanned",
                         {observability::StringField("file", key), observability::IntField("dates", static_cast<int64_t>(file_dates.size()))});
    dates.merge(file_dates);
  }
  return dates;
}

uint64_t DateLoader::Run() {
  observability::SpanScope span("dimension.dates");

  const auto dates = CollectDates();
  if (dates.empty()) {
    FLIGHTLINE_LOG_INFO("no pending fact files; date_dim unchanged");
    return 0;
  }

  const auto offered = EnsureDates(*repo_, dates);
  span.SetAttribute("dates", static_cast<int64_t>(offered));
  FLIGHTLINE_LOG_INFO("date_dim loaded", {observability::IntField("dates", static_cast<int64_t>(offered)),
                                          observability::StringField("first", *dates.begin()),
                                          observability::StringField("last", *dates.rbegin())});
  return offered;
}

} // namespace flightline::dimension
