#include "stage_graph.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flightline::orchestrator {

std::string_view StageStateName(StageState state) {
  switch (state) {
    case StageState::Pending: return "pending";
    case StageState::Succeeded: return "succeeded";
    case StageState::Failed: return "failed";
    case StageState::Blocked: return "blocked";
  }
  return "unknown";
}

bool RunReport::Succeeded() const {
  return std::all_of(stages.begin(), stages.end(), [](const StageOutcome& s) { return s.state == StageState::Succeeded; });
}

const StageOutcome* RunReport::Find(const std::string& name) const {
  for (const auto& s : stages) {
    if (s.name == name) {
      return &s;
    }
  }
  return nullptr;
}

void StageGraph::Add(Stage stage) {
  if (stage.name.empty()) {
    throw std::invalid_argument("stage name must not be empty");
  }
  if (wave_of_.contains(stage.name)) {
    throw std::invalid_argument("duplicate stage: " + stage.name);
  }

  int wave = 0;
  for (const auto& dep : stage.deps) {
    auto it = wave_of_.find(dep);
    if (it == wave_of_.end()) {
      throw std::invalid_argument("stage " + stage.name + " depends on unknown stage " + dep);
    }
    wave = std::max(wave, it->second + 1);
  }

  wave_of_.emplace(stage.name, wave);
  stages_.push_back(std::move(stage));
}

std::vector<std::vector<std::string>> StageGraph::Waves() const {
  std::vector<std::vector<std::string>> waves;
  for (const auto& stage : stages_) {
    const auto wave = static_cast<std::size_t>(wave_of_.at(stage.name));
    if (waves.size() <= wave) {
      waves.resize(wave + 1);
    }
    waves[wave].push_back(stage.name);
  }
  return waves;
}

std::vector<std::string> StageGraph::StageNames() const {
  std::vector<std::string> names;
  names.reserve(stages_.size());
  for (const auto& stage : stages_) {
    names.push_back(stage.name);
  }
  return names;
}

const Stage& StageGraph::Get(const std::string& name) const {
  for (const auto& stage : stages_) {
    if (stage.name == name) {
      return stage;
    }
  }
  throw std::invalid_argument("unknown stage: " + name);
}

StageOutcome StageGraph::RunWithRetry(const Stage& stage, const RetryPolicy& policy) {
  observability::StageLogScope log_scope(stage.name);
  observability::SpanScope     span("stage." + stage.name);

  StageOutcome outcome;
  outcome.name = stage.name;

  const auto start = std::chrono::steady_clock::now();
  while (true) {
    ++outcome.attempts;
    FLIGHTLINE_LOG_INFO("stage started", {observability::IntField("attempt", outcome.attempts)});
    try {
      stage.body();
      outcome.state = StageState::Succeeded;
      outcome.error.clear();
      break;
    } catch (const util::QualityGateFailure& e) {
      outcome.state = StageState::Failed;
      outcome.error = e.what();
      break;
    } catch (const std::exception& e) {
      outcome.state = StageState::Failed;
      outcome.error = e.what();
      span.RecordException(e.what());
    }

    if (outcome.attempts > policy.max_retries) {
      break;
    }
    FLIGHTLINE_LOG_WARN("stage failed; retrying", {observability::IntField("attempt", outcome.attempts),
                                                   observability::IntField("delay_ms", policy.delay.count()),
                                                   observability::StringField("error", outcome.error)});
    std::this_thread::sleep_for(policy.delay);
  }
  outcome.duration_ms = util::ElapsedMs(start);

  const bool ok = outcome.state == StageState::Succeeded;
  observability::Metrics::Instance().RecordStage(stage.name, ok);
  observability::Metrics::Instance().ObserveStageDurationMs(stage.name, outcome.duration_ms);
  span.SetAttribute("attempts", static_cast<int64_t>(outcome.attempts));
  span.SetAttribute("state", StageStateName(outcome.state));

  if (ok) {
    FLIGHTLINE_LOG_INFO("stage succeeded", {observability::IntField("attempts", outcome.attempts),
                                            observability::DoubleField("duration_ms", outcome.duration_ms)});
  } else {
    FLIGHTLINE_LOG_ERROR("stage failed", {observability::IntField("attempts", outcome.attempts),
                                          observability::StringField("error", outcome.error)});
  }
  return outcome;
}

RunReport StageGraph::Run(const RetryPolicy& policy, bool parallel) const {
  std::unordered_map<std::string, StageOutcome> outcomes;

  for (const auto& wave : Waves()) {
    std::vector<const Stage*> runnable;
    for (const auto& name : wave) {
      const auto& stage = Get(name);

      std::string blocker;
      for (const auto& dep : stage.deps) {
        if (outcomes.at(dep).state != StageState::Succeeded) {
          blocker = dep;
          break;
        }
      }
      if (blocker.empty()) {
        runnable.push_back(&stage);
        continue;
      }

      StageOutcome blocked;
      blocked.name  = name;
      blocked.state = StageState::Blocked;
      blocked.error = "upstream stage " + blocker + " did not succeed";
      FLIGHTLINE_LOG_WARN("stage blocked", {observability::StringField("stage", name), observability::StringField("upstream", blocker)});
      outcomes.emplace(name, std::move(blocked));
    }

    if (parallel && runnable.size() > 1) {
      std::vector<std::future<StageOutcome>> futures;
      futures.reserve(runnable.size());
      for (const auto* stage : runnable) {
        futures.push_back(std::async(std::launch::async, [stage, &policy] { return RunWithRetry(*stage, policy); }));
      }
      for (std::size_t i = 0; i < futures.size(); ++i) {
        outcomes.emplace(runnable[i]->name, futures[i].get());
      }
    } else {
      for (const auto* stage : runnable) {
        outcomes.emplace(stage->name, RunWithRetry(*stage, policy));
      }
    }
  }

  RunReport report;
  for (const auto& stage : stages_) {
    report.stages.push_back(std::move(outcomes.at(stage.name)));
  }
  return report;
}

StageOutcome StageGraph::RunStage(const std::string& name, const RetryPolicy& policy) const {
  return RunWithRetry(Get(name), policy);
}

} // namespace flightline::orchestrator
