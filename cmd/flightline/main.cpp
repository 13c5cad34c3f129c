#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/orchestrator/flight_pipeline.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace {

constexpr int kExitUsage          = 1;
constexpr int kExitFatal          = 2;
constexpr int kExitPipelineFailed = 3;

void PrintUsage() {
  std::cerr << "Usage: flightline --config <config.yaml> [--stage <name>]" << std::endl
            << "       flightline <config.yaml>" << std::endl
            << "Stages: upload airports carriers dates flights weather quality" << std::endl;
}

void Shutdown() {
  flightline::storage::common::FinalizeFileSystems();
  flightline::observability::ShutdownLogging();
  flightline::observability::ShutdownMetrics();
  flightline::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string stage;

  if (argc == 2 && std::string(argv[1]).rfind("--", 0) != 0) {
    config_path = argv[1];
  } else {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--stage" && i + 1 < argc) {
        stage = argv[++i];
      } else {
        PrintUsage();
        return kExitUsage;
      }
    }
  }
  if (config_path.empty()) {
    PrintUsage();
    return kExitUsage;
  }

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flightline::config::ConfigLoader::LoadFromYaml(config_path);

    flightline::observability::InitializeTracing(config);
    flightline::observability::InitializeMetrics(config);
    flightline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build collaborators and the stage graph
    // ------------------------------------------------------------
    flightline::orchestrator::FlightPipeline pipeline(flightline::factory::Build(config));

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    if (stage.empty()) {
      const auto report = pipeline.Run();
      if (!report.Succeeded()) {
        exit_code = kExitPipelineFailed;
      }
    } else {
      FLIGHTLINE_LOG_INFO("running single stage", {flightline::observability::StringField("stage", stage)});
      const auto outcome = pipeline.RunStage(stage);
      if (outcome.state != flightline::orchestrator::StageState::Succeeded) {
        exit_code = kExitPipelineFailed;
      }
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    PrintUsage();
    Shutdown();
    return kExitUsage;
  } catch (const std::exception& e) {
    FLIGHTLINE_LOG_ERROR("Fatal error", {flightline::observability::StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }

  Shutdown();
  return exit_code;
}
