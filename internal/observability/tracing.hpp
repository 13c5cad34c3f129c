#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace flightline::runtime::config {
class RuntimeConfig;
}

namespace flightline::observability {

// False when tracing is disabled in config or the build has no ENABLE_OTEL.
bool InitializeTracing(const flightline::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  SpanScope

  RAII span made active for its lifetime. Stages open "stage.<name>",
  loaders open one span per file or batch.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const flightline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace flightline::observability
