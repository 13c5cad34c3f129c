#include "internal/orchestrator/stage_graph.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using flightline::orchestrator::RetryPolicy;
using flightline::orchestrator::StageGraph;
using flightline::orchestrator::StageState;

// Records stage execution order across threads.
class Trace {
 public:
  void Hit(const std::string& name) {
    std::lock_guard lock(mu_);
    order_.push_back(name);
  }

  std::vector<std::string> Order() {
    std::lock_guard lock(mu_);
    return order_;
  }

  std::size_t IndexOf(const std::string& name) {
    std::lock_guard lock(mu_);
    for (std::size_t i = 0; i < order_.size(); ++i) {
      if (order_[i] == name) return i;
    }
    return order_.size();
  }

 private:
  std::mutex               mu_;
  std::vector<std::string> order_;
};

// upload -> {airports, carriers, dates} -> flights -> weather -> quality
StageGraph PipelineShape(Trace& trace) {
  StageGraph graph;
  auto       body = [&trace](std::string name) { return [&trace, name] { trace.Hit(name); }; };

  graph.Add({"upload", {}, body("upload")});
  graph.Add({"airports", {"upload"}, body("airports")});
  graph.Add({"carriers", {"upload"}, body("carriers")});
  graph.Add({"dates", {"upload"}, body("dates")});
  graph.Add({"flights", {"airports", "carriers", "dates"}, body("flights")});
  graph.Add({"weather", {"flights"}, body("weather")});
  graph.Add({"quality", {"weather"}, body("quality")});
  return graph;
}

void TestWaves() {
  Trace trace;
  auto  graph = PipelineShape(trace);

  const auto waves = graph.Waves();
  assert(waves.size() == 5);
  assert(waves[0] == std::vector<std::string>{"upload"});
  assert(waves[1] == (std::vector<std::string>{"airports", "carriers", "dates"}));
  assert(waves[2] == std::vector<std::string>{"flights"});
  assert(waves[4] == std::vector<std::string>{"quality"});
  assert(graph.StageNames().size() == 7);
}

void TestRegistrationErrors() {
  StageGraph graph;
  graph.Add({"a", {}, [] {}});

  auto rejects = [&graph](flightline::orchestrator::Stage stage) {
    try {
      graph.Add(std::move(stage));
    } catch (const std::invalid_argument&) {
      return true;
    }
    return false;
  };

  assert(rejects({"a", {}, [] {}}));
  assert(rejects({"b", {"missing"}, [] {}}));
  assert(rejects({"", {}, [] {}}));
  assert(graph.StageNames() == std::vector<std::string>{"a"});
}

void TestSequentialRunHonoursDependencies() {
  Trace trace;
  auto  report = PipelineShape(trace).Run(RetryPolicy{}, false);

  assert(report.Succeeded());
  assert(report.stages.size() == 7);
  assert(report.stages[0].name == "upload");
  assert(report.stages[0].attempts == 1);
  assert((trace.Order() == std::vector<std::string>{"upload", "airports", "carriers", "dates", "flights", "weather", "quality"}));
}

void TestParallelWaveRunsConcurrently() {
  Trace            trace;
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  auto overlap = [&](std::string name) {
    return [&, name] {
      const int now = ++running;
      int       seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      trace.Hit(name);
      --running;
    };
  };

  StageGraph graph;
  graph.Add({"upload", {}, [&trace] { trace.Hit("upload"); }});
  graph.Add({"airports", {"upload"}, overlap("airports")});
  graph.Add({"carriers", {"upload"}, overlap("carriers")});
  graph.Add({"dates", {"upload"}, overlap("dates")});
  graph.Add({"flights", {"airports", "carriers", "dates"}, [&trace] { trace.Hit("flights"); }});

  auto report = graph.Run(RetryPolicy{}, true);
  assert(report.Succeeded());
  assert(peak.load() > 1);
  // fan-in waits for every upstream stage
  assert(trace.IndexOf("flights") == 4);
}

void TestFailureRetriesThenBlocksDependents() {
  int        attempts = 0;
  StageGraph graph;
  graph.Add({"airports", {}, [&attempts] {
               ++attempts;
               throw flightline::util::StorageError("airports.dat unreadable");
             }});
  graph.Add({"carriers", {}, [] {}});
  graph.Add({"flights", {"airports", "carriers"}, [] { assert(false && "must not run"); }});
  graph.Add({"quality", {"flights"}, [] { assert(false && "must not run"); }});

  RetryPolicy policy;
  policy.max_retries = 2;
  policy.delay       = std::chrono::milliseconds(1);

  auto report = graph.Run(policy, false);
  assert(!report.Succeeded());
  assert(attempts == 3);

  const auto* airports = report.Find("airports");
  assert(airports && airports->state == StageState::Failed);
  assert(airports->attempts == 3);
  assert(airports->error == "airports.dat unreadable");

  assert(report.Find("carriers")->state == StageState::Succeeded);
  assert(report.Find("flights")->state == StageState::Blocked);
  assert(report.Find("flights")->error == "upstream stage airports did not succeed");
  assert(report.Find("quality")->state == StageState::Blocked);
  assert(report.Find("quality")->attempts == 0);
  assert(report.Find("missing") == nullptr);
}

void TestTransientFailureRecovers() {
  int        attempts = 0;
  StageGraph graph;
  graph.Add({"flights", {}, [&attempts] {
               if (++attempts < 2) throw std::runtime_error("connection reset");
             }});

  RetryPolicy policy;
  policy.max_retries = 2;

  auto report = graph.Run(policy, true);
  assert(report.Succeeded());
  assert(report.stages[0].attempts == 2);
  assert(report.stages[0].error.empty());
}

void TestQualityGateFailureIsNotRetried() {
  int        attempts = 0;
  StageGraph graph;
  graph.Add({"quality", {}, [&attempts] {
               ++attempts;
               throw flightline::util::QualityGateFailure("1 quality checks failed");
             }});

  RetryPolicy policy;
  policy.max_retries = 5;

  auto outcome = graph.RunStage("quality", policy);
  assert(outcome.state == StageState::Failed);
  assert(outcome.attempts == 1);
  assert(attempts == 1);
  assert(outcome.error == "1 quality checks failed");
}

void TestRunStageIgnoresDependencies() {
  Trace trace;
  auto  graph = PipelineShape(trace);

  auto outcome = graph.RunStage("weather", RetryPolicy{});
  assert(outcome.state == StageState::Succeeded);
  assert(trace.Order() == std::vector<std::string>{"weather"});

  bool threw = false;
  try {
    (void)graph.RunStage("nope", RetryPolicy{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWaves();
  TestRegistrationErrors();
  TestSequentialRunHonoursDependencies();
  TestParallelWaveRunsConcurrently();
  TestFailureRetriesThenBlocksDependents();
  TestTransientFailureRecovers();
  TestQualityGateFailureIsNotRetried();
  TestRunStageIgnoresDependencies();

  std::cout << "flightline_unit_stage_graph: pass\n";
  return 0;
}
