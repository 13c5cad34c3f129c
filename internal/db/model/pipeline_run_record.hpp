#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flightline::db::model {

enum class RunStatus {
  Running,
  Completed,
  Failed,
};

inline std::string_view RunStatusName(RunStatus status) {
  switch (status) {
    case RunStatus::Running: return "running";
    case RunStatus::Completed: return "completed";
    case RunStatus::Failed: return "failed";
  }
  return "failed";
}

inline std::optional<RunStatus> ParseRunStatus(std::string_view name) {
  if (name == "running") return RunStatus::Running;
  if (name == "completed") return RunStatus::Completed;
  if (name == "failed") return RunStatus::Failed;
  return std::nullopt;
}

/*
  Ledger row, unique on (file_name, source).

  Once status == Completed:
    rows_loaded + rows_rejected == rows_processed
*/
struct PipelineRunRecord {
  std::string file_name;
  std::string source; // flights | airports | weather

  uint64_t rows_processed = 0;
  uint64_t rows_loaded    = 0;
  uint64_t rows_rejected  = 0;

  RunStatus status = RunStatus::Running;

  // epoch ms, 0 = not set
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  std::string error_message;
};

} // namespace flightline::db::model
