#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace flightline::runtime::config {
class RuntimeConfig;
}

namespace flightline::observability {

// key=value pair appended to a log line
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// FLIGHTLINE_LOG_LEVEL and FLIGHTLINE_LOG_PATTERN override the config file.
struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      include_trace_context = false;
};

LogSettings ResolveLogSettings(const flightline::runtime::config::RuntimeConfig& config);

void InitializeLogging(const flightline::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  StageLogScope

  Tags every line logged on the current thread with stage=<name> until
  destroyed. Scopes nest; the innermost name wins.
*/
class StageLogScope {
 public:
  explicit StageLogScope(std::string stage);
  ~StageLogScope();

  StageLogScope(const StageLogScope&)            = delete;
  StageLogScope& operator=(const StageLogScope&) = delete;

 private:
  std::string previous_;
};

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace flightline::observability

#define FLIGHTLINE_LOG_DEBUG(message, ...) ::flightline::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define FLIGHTLINE_LOG_INFO(message, ...) ::flightline::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define FLIGHTLINE_LOG_WARN(message, ...) ::flightline::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define FLIGHTLINE_LOG_ERROR(message, ...) ::flightline::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
