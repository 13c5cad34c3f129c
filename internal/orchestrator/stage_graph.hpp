#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace flightline::orchestrator {

enum class StageState {
  Pending,
  Succeeded,
  Failed,
  Blocked, // a dependency did not succeed
};

std::string_view StageStateName(StageState state);

struct RetryPolicy {
  uint32_t                  max_retries = 0;
  std::chrono::milliseconds delay{0};
};

struct Stage {
  std::string              name;
  std::vector<std::string> deps;
  std::function<void()>    body;
};

struct StageOutcome {
  std::string name;
  StageState  state    = StageState::Pending;
  uint32_t    attempts = 0;
  std::string error;
  double      duration_ms = 0.0;
};

struct RunReport {
  std::vector<StageOutcome> stages; // registration order

  bool Succeeded() const;

  // nullptr when no stage has that name
  const StageOutcome* Find(const std::string& name) const;
};

/*
  StageGraph

  Dependency-ordered stage runner.

  - Stages are registered after their dependencies, so the graph is
    acyclic by construction
  - Run() executes wave by wave: a stage's wave is one past the
    deepest of its dependencies, so fan-in waits for every upstream
    stage
  - Stages of one wave run concurrently when parallel is set
  - A failing stage is retried up to max_retries times with a fixed
    delay; util::QualityGateFailure is never retried
  - Dependents of a stage that did not succeed are Blocked
*/
class StageGraph {
 public:
  // Throws std::invalid_argument for a duplicate name or an unknown dependency.
  void Add(Stage stage);

  std::vector<std::vector<std::string>> Waves() const;

  std::vector<std::string> StageNames() const;

  RunReport Run(const RetryPolicy& policy, bool parallel) const;

  // Run one stage alone, ignoring its dependencies. Throws std::invalid_argument for an unknown name.
  StageOutcome RunStage(const std::string& name, const RetryPolicy& policy) const;

 private:
  const Stage& Get(const std::string& name) const;

  static StageOutcome RunWithRetry(const Stage& stage, const RetryPolicy& policy);

  std::vector<Stage>                   stages_;
  std::unordered_map<std::string, int> wave_of_;
};

} // namespace flightline::orchestrator
