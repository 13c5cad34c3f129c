#include "airport_loader.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/coerce.hpp"
#include "internal/util/errors.hpp"

namespace flightline::dimension {

namespace {

enum AirportColumn : std::size_t {
  kName = 0,
  kCity,
  kCountry,
  kCode,
  kLatitude,
  kLongitude,
  kAltitude,
  kTimezone,
};

} // namespace

const std::vector<std::string>& AirportFileColumns() {
  static const std::vector<std::string> kColumns = {"id",        "airport_name", "city",      "country",  "airport_code",
                                                    "icao",      "latitude",     "longitude", "altitude", "tz_offset",
                                                    "dst",       "timezone",     "type",      "source"};
  return kColumns;
}

const std::vector<std::string>& AirportLoader::ProjectedColumns() {
  static const std::vector<std::string> kColumns = {"airport_name", "city",     "country",  "airport_code",
                                                    "latitude",     "longitude", "altitude", "timezone"};
  return kColumns;
}

void AirportCollector::Add(const storage::csv::CsvRow& row) {
  ++rows_seen_;

  auto code = util::ToText(row[kCode]);
  if (!code || code->size() != 3) {
    return;
  }
  if (!seen_.insert(*code).second) {
    return;
  }

  db::model::AirportRecord r;
  r.airport_code = *code;
  r.airport_name = util::ToText(row[kName]).value_or("");
  r.city         = util::ToText(row[kCity]);
  r.country      = util::ToText(row[kCountry]);
  r.latitude     = util::ToDouble(row[kLatitude]);
  r.longitude    = util::ToDouble(row[kLongitude]);
  r.altitude     = util::ToInteger(row[kAltitude]);
  r.timezone     = util::ToText(row[kTimezone]);
  records_.push_back(std::move(r));
}

AirportLoader::AirportLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                             std::shared_ptr<ledger::Ledger> ledger, std::string airports_key)
    : repo_(std::move(repo)), store_(std::move(store)), ledger_(std::move(ledger)), airports_key_(std::move(airports_key)) {
}

AirportLoadResult AirportLoader::Run() {
  observability::SpanScope span("dimension.airports");
  span.SetAttribute("key", airports_key_);

  if (!store_->Exists(airports_key_)) {
    throw util::StorageError("airports reference missing: " + airports_key_);
  }

  const auto file_name = storage::common::BaseName(airports_key_);
  auto       run       = ledger_->Begin(file_name, ledger::kAirportsSource);

  AirportLoadResult result;
  try {
    storage::csv::CsvReadSpec spec;
    spec.columns      = ProjectedColumns();
    spec.header_names = AirportFileColumns();
    spec.null_values  = {"", "\\N"};

    storage::csv::ChunkedCsvReader reader(*store_, airports_key_, spec);
    storage::csv::CsvChunk         chunk;
    AirportCollector               collector;
    while (reader.Next(chunk)) {
      for (const auto& row : chunk.rows) {
        collector.Add(row);
      }
    }

    auto tx = repo_->Begin();
    util::ThrowIfDbError(repo_->InsertAirports(*tx, collector.Records()), "insert airports");
    tx->Commit();

    result.rows_read = collector.RowsSeen();
    result.loaded    = collector.Records().size();
    result.rejected  = result.rows_read - result.loaded;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    ledger_->Fail(run, e.what());
    throw;
  }

  run.rows_processed = result.rows_read;
  run.rows_loaded    = result.loaded;
  run.rows_rejected  = result.rejected;
  ledger_->Complete(run);

  observability::Metrics::Instance().AddRows(ledger::kAirportsSource, result.loaded, result.rejected);
  FLIGHTLINE_LOG_INFO("airports loaded", {observability::IntField("rows_read", static_cast<int64_t>(result.rows_read)),
                                          observability::IntField("loaded", static_cast<int64_t>(result.loaded)),
                                          observability::IntField("skipped", static_cast<int64_t>(result.rejected))});
  return result;
}

} // namespace flightline::dimension
