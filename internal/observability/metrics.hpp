#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace flightline::runtime::config {
class RuntimeConfig;
}

namespace flightline::observability {

// False when metrics are disabled in config or the build has no ENABLE_OTEL.
bool InitializeMetrics(const flightline::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments:
    flightline.stage.count        {stage, success}
    flightline.stage.duration_ms  {stage}
    flightline.rows.loaded        {source}
    flightline.rows.rejected      {source}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordStage(std::string_view stage, bool success);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void AddRows(std::string_view source, std::uint64_t loaded, std::uint64_t rejected);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const flightline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordStage(std::string_view, bool) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::AddRows(std::string_view, std::uint64_t, std::uint64_t) {
}
#endif

} // namespace flightline::observability
