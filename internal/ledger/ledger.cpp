#include "ledger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flightline::ledger {

using db::model::PipelineRunRecord;
using db::model::RunStatus;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool IsFactFileKey(const std::string& key, const std::string& fact_prefix) {
  if (key.rfind(fact_prefix, 0) != 0) {
    return false;
  }
  const auto name = Lower(storage::common::BaseName(key));
  return EndsWith(name, ".csv") && name.find("airport") == std::string::npos;
}

Ledger::Ledger(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store, std::string fact_prefix)
    : repo_(std::move(repo)), store_(std::move(store)), fact_prefix_(std::move(fact_prefix)) {
}

std::vector<std::string> Ledger::ListFactFiles() {
  std::vector<std::string> files;
  for (auto& key : store_->List(fact_prefix_)) {
    if (IsFactFileKey(key, fact_prefix_)) {
      files.push_back(std::move(key));
    }
  }
  return files;
}

std::set<std::string> Ledger::CompletedFiles(const std::string& source) {
  auto tx    = repo_->Begin();
  auto files = repo_->ListCompletedFiles(*tx, source);
  tx->Commit();
  return {files.begin(), files.end()};
}

std::vector<std::string> Ledger::PendingFiles(const std::string& source) {
  const auto completed = CompletedFiles(source);

  std::vector<std::string> pending;
  for (auto& key : ListFactFiles()) {
    if (!completed.contains(storage::common::BaseName(key))) {
      pending.push_back(std::move(key));
    }
  }
  return pending;
}

void Ledger::Upsert(const PipelineRunRecord& run) {
  auto tx = repo_->Begin();
  util::ThrowIfDbError(repo_->UpsertPipelineRun(*tx, run), "ledger upsert " + run.source + "/" + run.file_name);
  tx->Commit();
}

PipelineRunRecord Ledger::Begin(const std::string& file_name, const std::string& source) {
  PipelineRunRecord run;
  run.file_name     = file_name;
  run.source        = source;
  run.status        = RunStatus::Running;
  run.started_at_ms = util::ToUnixMillis(util::Now());

  Upsert(run);
  return run;
}

void Ledger::Complete(PipelineRunRecord& run) {
  if (run.rows_loaded + run.rows_rejected != run.rows_processed) {
    throw std::logic_error("ledger counts do not add up for " + run.source + "/" + run.file_name);
  }

  run.status          = RunStatus::Completed;
  run.completed_at_ms = util::ToUnixMillis(util::Now());
  run.error_message.clear();
  Upsert(run);
}

bool Ledger::Fail(PipelineRunRecord& run, const std::string& error) {
  run.status          = RunStatus::Failed;
  run.completed_at_ms = 0;
  run.error_message   = error;

  try {
    Upsert(run);
    return true;
  } catch (const std::exception& e) {
    FLIGHTLINE_LOG_WARN("ledger unreachable while recording failure",
                        {observability::StringField("file", run.file_name), observability::StringField("source", run.source),
                         observability::StringField("error", e.what())});
    return false;
  }
}

std::optional<PipelineRunRecord> Ledger::LatestCompleted(const std::string& source) {
  auto tx  = repo_->Begin();
  auto run = repo_->GetLatestCompletedRun(*tx, source);
  tx->Commit();
  return run;
}

} // namespace flightline::ledger
