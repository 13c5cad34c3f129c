#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/object_store.hpp"

namespace flightline::ledger {

inline constexpr const char* kFlightsSource  = "flights";
inline constexpr const char* kAirportsSource = "airports";
inline constexpr const char* kWeatherSource  = "weather";

// A .csv directly under the fact prefix whose name does not mention "airport".
bool IsFactFileKey(const std::string& key, const std::string& fact_prefix);

/*
  Ledger

  Tracks which source files are fully ingested per logical source.
  A file is skipped by later runs only once its row is completed;
  running and failed rows are retried.

  Every call runs in its own transaction. The ledger records the
  object's base name, not the full key.
*/
class Ledger {
 public:
  Ledger(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store, std::string fact_prefix);

  // Fact-classified keys under the fact prefix, ascending.
  std::vector<std::string> ListFactFiles();

  std::set<std::string> CompletedFiles(const std::string& source);

  // Fact keys whose base name is not completed for source, in key order.
  std::vector<std::string> PendingFiles(const std::string& source);

  db::model::PipelineRunRecord Begin(const std::string& file_name, const std::string& source);

  // Requires rows_loaded + rows_rejected == rows_processed.
  void Complete(db::model::PipelineRunRecord& run);

  /*
    Mark the run failed with error. Returns false (and logs) when the
    ledger itself is unreachable so callers can rethrow their own
    error.
  */
  bool Fail(db::model::PipelineRunRecord& run, const std::string& error);

  std::optional<db::model::PipelineRunRecord> LatestCompleted(const std::string& source);

 private:
  void Upsert(const db::model::PipelineRunRecord& run);

  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::string                          fact_prefix_;
};

} // namespace flightline::ledger
