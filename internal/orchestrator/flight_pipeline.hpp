#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/ledger/ledger.hpp"
#include "internal/orchestrator/stage_graph.hpp"
#include "internal/pipeline/stage_context.hpp"

namespace flightline::orchestrator {

inline constexpr const char* kUploadStage   = "upload";
inline constexpr const char* kAirportsStage = "airports";
inline constexpr const char* kCarriersStage = "carriers";
inline constexpr const char* kDatesStage    = "dates";
inline constexpr const char* kFlightsStage  = "flights";
inline constexpr const char* kWeatherStage  = "weather";
inline constexpr const char* kQualityStage  = "quality";

/*
  FlightPipeline

  The ingestion DAG:

      upload -> airports -> {carriers, dates} -> flights -> weather -> quality

  Retry count, retry delay and carriers/dates parallelism come from
  the pipeline config section.
*/
class FlightPipeline {
 public:
  explicit FlightPipeline(pipeline::StageContext context);

  // stage bodies capture this
  FlightPipeline(const FlightPipeline&)            = delete;
  FlightPipeline& operator=(const FlightPipeline&) = delete;

  RunReport Run();

  // External-scheduler entry point: one stage, dependencies not checked.
  StageOutcome RunStage(const std::string& name);

  const StageGraph& Graph() const {
    return graph_;
  }

  RetryPolicy Policy() const;

 private:
  void BuildGraph();

  pipeline::StageContext          ctx_;
  std::shared_ptr<ledger::Ledger> ledger_;
  StageGraph                      graph_;
};

} // namespace flightline::orchestrator
