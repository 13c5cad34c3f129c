#include "flight_pipeline.hpp"

#include <map>

#include "internal/dimension/airport_loader.hpp"
#include "internal/dimension/carrier_loader.hpp"
#include "internal/dimension/date_loader.hpp"
#include "internal/fact/fact_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/raw_uploader.hpp"
#include "internal/quality/quality_gate.hpp"
#include "internal/weather/weather_loader.hpp"

namespace flightline::orchestrator {

FlightPipeline::FlightPipeline(pipeline::StageContext context) : ctx_(std::move(context)) {
  ledger_ = std::make_shared<ledger::Ledger>(ctx_.repository, ctx_.store, ctx_.config.storage().fact_prefix());
  BuildGraph();
}

RetryPolicy FlightPipeline::Policy() const {
  const auto& p     = ctx_.config.pipeline();
  const auto& delay = p.retry_delay();

  RetryPolicy policy;
  policy.max_retries = p.max_retries();
  policy.delay = std::chrono::milliseconds(delay.seconds() * 1000 + delay.nanos() / 1000000);
  return policy;
}

void FlightPipeline::BuildGraph() {
  const auto chunk_rows = static_cast<std::size_t>(ctx_.config.pipeline().chunk_size());

  graph_.Add({kUploadStage, {}, [this] { pipeline::RawUploader(ctx_.store, ctx_.config.storage()).Run(); }});

  graph_.Add({kAirportsStage, {kUploadStage}, [this, key = ctx_.config.storage().airports_key()] {
                dimension::AirportLoader(ctx_.repository, ctx_.store, ledger_, key).Run();
              }});

  graph_.Add({kCarriersStage, {kAirportsStage}, [this, chunk_rows] {
                dimension::CarrierLoader(ctx_.repository, ctx_.store, ledger_, chunk_rows).Run();
              }});

  graph_.Add({kDatesStage, {kAirportsStage}, [this, chunk_rows] {
                dimension::DateLoader(ctx_.repository, ctx_.store, ledger_, chunk_rows).Run();
              }});

  graph_.Add({kFlightsStage, {kCarriersStage, kDatesStage}, [this, chunk_rows] {
                fact::FactLoader(ctx_.repository, ctx_.store, ledger_, chunk_rows).Run();
              }});

  graph_.Add({kWeatherStage, {kFlightsStage}, [this] {
                const auto& cfg = ctx_.config.weather();
                std::map<std::string, std::string> stations;
                for (const auto& [airport, station] : cfg.airport_stations()) {
                  stations.emplace(airport, station);
                }
                weather::WeatherLoader(ctx_.repository, ctx_.observations, ledger_, std::move(stations), cfg.source_name())
                    .Run();
              }});

  graph_.Add({kQualityStage, {kWeatherStage}, [this] {
                const auto& p = ctx_.config.pipeline();

                quality::QualityThresholds thresholds;
                thresholds.max_rejection_rate = p.max_rejection_rate();
                thresholds.delay_floor        = p.delay_floor();
                thresholds.delay_ceiling      = p.delay_ceiling();
                quality::QualityGate(ctx_.repository, thresholds).Run();
              }});
}

RunReport FlightPipeline::Run() {
  const auto policy = Policy();
  FLIGHTLINE_LOG_INFO("pipeline run started", {observability::IntField("max_retries", policy.max_retries),
                                               observability::IntField("retry_delay_ms", policy.delay.count())});

  auto report = graph_.Run(policy, ctx_.config.pipeline().parallel_dimensions());

  for (const auto& stage : report.stages) {
    FLIGHTLINE_LOG_INFO("stage result", {observability::StringField("stage", stage.name),
                                         observability::StringField("state", StageStateName(stage.state)),
                                         observability::IntField("attempts", stage.attempts)});
  }
  if (report.Succeeded()) {
    FLIGHTLINE_LOG_INFO("pipeline run succeeded");
  } else {
    FLIGHTLINE_LOG_ERROR("pipeline run failed");
  }
  return report;
}

StageOutcome FlightPipeline::RunStage(const std::string& name) {
  return graph_.RunStage(name, Policy());
}

} // namespace flightline::orchestrator
