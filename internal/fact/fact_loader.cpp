#include "fact_loader.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/dimension/date_dim.hpp"
#include "internal/dimension/date_loader.hpp"
#include "internal/fact/flight_row.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/csv/csv_reader.hpp"
#include "internal/util/errors.hpp"

namespace flightline::fact {

FactLoader::FactLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                       std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_size)
    : repo_(std::move(repo)), store_(std::move(store)), ledger_(std::move(ledger)), chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("fact chunk size must be positive");
  }
}

FactLoadSummary FactLoader::Run() {
  FactLoadSummary summary;

  const auto pending = ledger_->PendingFiles(ledger::kFlightsSource);
  if (pending.empty()) {
    FLIGHTLINE_LOG_INFO("no new fact files");
    return summary;
  }

  for (const auto& key : pending) {
    auto file = LoadFile(key);
    summary.loaded += file.loaded;
    summary.rejected += file.rejected;
    summary.files.push_back(std::move(file));
  }

  FLIGHTLINE_LOG_INFO("fact load finished", {observability::IntField("files", static_cast<int64_t>(summary.files.size())),
                                             observability::IntField("loaded", static_cast<int64_t>(summary.loaded)),
                                             observability::IntField("rejected", static_cast<int64_t>(summary.rejected))});
  return summary;
}

void FactLoader::RequireColumns(const std::string& key) {
  const auto header = storage::csv::ReadHeader(*store_, key);

  std::string missing;
  for (const auto& column : RequiredFactColumns()) {
    if (std::find(header.begin(), header.end(), column) == header.end()) {
      missing += missing.empty() ? column : ", " + column;
    }
  }
  if (!missing.empty()) {
    throw util::SchemaError(key + " missing required columns: " + missing);
  }
}

void FactLoader::MergeFileDates(const std::string& key, DimensionSnapshot& snapshot) {
  std::set<std::string> missing;
  for (auto& date : dimension::ScanFlightDates(*store_, key, chunk_size_)) {
    if (!snapshot.dates.contains(date)) {
      missing.insert(std::move(date));
    }
  }
  if (missing.empty()) {
    return;
  }

  dimension::EnsureDates(*repo_, missing);
  snapshot.dates.insert(missing.begin(), missing.end());

  FLIGHTLINE_LOG_INFO("date_dim extended", {observability::StringField("file", key),
                                            observability::IntField("dates", static_cast<int64_t>(missing.size()))});
}

void FactLoader::CommitChunk(const std::string& key, uint64_t chunk_index, const std::vector<db::model::FlightRecord>& accepted,
                             const std::vector<db::model::RejectedRecord>& rejected) {
  auto tx = repo_->Begin();
  if (!accepted.empty()) {
    util::ThrowIfDbError(repo_->InsertFlights(*tx, accepted), key + " chunk " + std::to_string(chunk_index) + ": insert flights");
  }
  if (!rejected.empty()) {
    util::ThrowIfDbError(repo_->AppendRejectedRecords(*tx, rejected),
                         key + " chunk " + std::to_string(chunk_index) + ": append rejects");
  }
  tx->Commit();
}

FileLoadResult FactLoader::LoadFile(const std::string& key) {
  observability::SpanScope span("fact.load_file");
  span.SetAttribute("file", key);

  FileLoadResult result;
  result.file_name = storage::common::BaseName(key);

  auto run = ledger_->Begin(result.file_name, ledger::kFlightsSource);

  try {
    RequireColumns(key);

    auto snapshot = DimensionSnapshot::Load(*repo_);
    MergeFileDates(key, snapshot);

    storage::csv::CsvReadSpec spec;
    spec.columns    = FactColumns();
    spec.chunk_rows = chunk_size_;

    storage::csv::ChunkedCsvReader reader(*store_, key, spec);
    storage::csv::CsvChunk         chunk;
    while (reader.Next(chunk)) {
      std::vector<db::model::FlightRecord>   accepted;
      std::vector<db::model::RejectedRecord> rejected;
      accepted.reserve(chunk.rows.size());

      for (std::size_t i = 0; i < chunk.rows.size(); ++i) {
        const auto& row     = chunk.rows[i];
        auto        verdict = ValidateRow(row, snapshot);
        if (verdict.accepted) {
          accepted.push_back(CoerceFlightRow(row, verdict.flight_date));
          continue;
        }

        db::model::RejectedRecord reject;
        reject.source           = ledger::kFlightsSource;
        reject.file_name        = result.file_name;
        reject.row_number       = chunk.first_row + i;
        reject.raw_data         = std::move(verdict.raw_data);
        reject.rejection_reason = verdict.Reason();

        FLIGHTLINE_LOG_DEBUG("row rejected", {observability::StringField("file", result.file_name),
                                              observability::IntField("chunk", static_cast<int64_t>(result.chunks)),
                                              observability::IntField("row", static_cast<int64_t>(reject.row_number)),
                                              observability::StringField("reason", reject.rejection_reason)});
        rejected.push_back(std::move(reject));
      }

      CommitChunk(key, result.chunks, accepted, rejected);

      result.processed += chunk.rows.size();
      result.loaded += accepted.size();
      result.rejected += rejected.size();

      FLIGHTLINE_LOG_DEBUG("chunk committed", {observability::StringField("file", result.file_name),
                                               observability::IntField("chunk", static_cast<int64_t>(result.chunks)),
                                               observability::IntField("accepted", static_cast<int64_t>(accepted.size())),
                                               observability::IntField("rejected", static_cast<int64_t>(rejected.size()))});
      ++result.chunks;
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    FLIGHTLINE_LOG_ERROR("fact file aborted", {observability::StringField("file", result.file_name),
                                               observability::IntField("chunk", static_cast<int64_t>(result.chunks)),
                                               observability::IntField("row", static_cast<int64_t>(result.processed)),
                                               observability::StringField("reason", e.what())});
    run.rows_processed = result.processed;
    run.rows_loaded    = result.loaded;
    run.rows_rejected  = result.rejected;
    ledger_->Fail(run, e.what());
    throw;
  }

  run.rows_processed = result.processed;
  run.rows_loaded    = result.loaded;
  run.rows_rejected  = result.rejected;
  ledger_->Complete(run);

  span.SetAttribute("loaded", static_cast<int64_t>(result.loaded));
  span.SetAttribute("rejected", static_cast<int64_t>(result.rejected));
  observability::Metrics::Instance().AddRows(ledger::kFlightsSource, result.loaded, result.rejected);

  FLIGHTLINE_LOG_INFO("fact file loaded", {observability::StringField("file", result.file_name),
                                           observability::IntField("processed", static_cast<int64_t>(result.processed)),
                                           observability::IntField("loaded", static_cast<int64_t>(result.loaded)),
                                           observability::IntField("rejected", static_cast<int64_t>(result.rejected)),
                                           observability::IntField("chunks", static_cast<int64_t>(result.chunks))});
  return result;
}

} // namespace flightline::fact
