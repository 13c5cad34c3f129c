#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/flight_summary.hpp"

namespace flightline::quality {

struct QualityThresholds {
  double max_rejection_rate = 0.05;
  double delay_floor        = -150.0;
  double delay_ceiling      = 5000.0;
};

struct CheckResult {
  std::string name;
  bool        passed = false;
  std::string detail;
};

struct QualityReport {
  std::vector<CheckResult> checks;
  uint64_t                 passed = 0;
  uint64_t                 failed = 0;

  db::model::FlightSummary summary;

  bool Passed() const {
    return failed == 0;
  }
};

/*
  QualityGate

  Post-load invariant checks over the whole warehouse. Every check runs
  regardless of earlier failures; Run() raises QualityGateFailure when
  any of them failed.
*/
class QualityGate {
 public:
  QualityGate(std::shared_ptr<db::Repository> repo, QualityThresholds thresholds);

  QualityReport Evaluate();

  // Evaluate, log the report, throw util::QualityGateFailure on any failure.
  QualityReport Run();

 private:
  std::shared_ptr<db::Repository> repo_;
  QualityThresholds               thresholds_;
};

} // namespace flightline::quality
