#pragma once

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace flightline::observability {

// Exporter target shared by the trace and metric pipelines.
struct OtlpSettings {
  std::string service_name;
  std::string endpoint;
};

/*
  Endpoint precedence: tracing.endpoint, then the signal specific
  variable (OTEL_EXPORTER_OTLP_TRACES_ENDPOINT or
  OTEL_EXPORTER_OTLP_METRICS_ENDPOINT), then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the local collector.
*/
inline OtlpSettings ResolveOtlpSettings(const flightline::runtime::config::TracingConfig& tracing, const char* signal_env) {
  OtlpSettings settings;
  settings.service_name = tracing.service_name().empty() ? "flightline" : tracing.service_name();

  if (!tracing.endpoint().empty()) {
    settings.endpoint = tracing.endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

} // namespace flightline::observability
