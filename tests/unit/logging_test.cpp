#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "config/config.pb.h"

namespace {

using flightline::observability::IntField;
using flightline::observability::ResolveLogSettings;
using flightline::observability::StageLogScope;
using flightline::observability::StringField;
using flightline::runtime::config::RuntimeConfig;

std::ostringstream& CaptureLog() {
  static std::ostringstream out;
  static bool               installed = false;
  if (!installed) {
    auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("flightline_test", sink);
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
    installed = true;
  }
  out.str("");
  return out;
}

void TestSettingsPreferEnvironment() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_pattern("%v");

  ::unsetenv("FLIGHTLINE_LOG_LEVEL");
  ::unsetenv("FLIGHTLINE_LOG_PATTERN");
  auto settings = ResolveLogSettings(config);
  assert(settings.level == spdlog::level::warn);
  assert(settings.pattern == "%v");

  ::setenv("FLIGHTLINE_LOG_LEVEL", "debug", 1);
  settings = ResolveLogSettings(config);
  assert(settings.level == spdlog::level::debug);
  ::unsetenv("FLIGHTLINE_LOG_LEVEL");

  settings = ResolveLogSettings(RuntimeConfig{});
  assert(settings.level == spdlog::level::info);
  assert(!settings.pattern.empty());
  assert(!settings.include_trace_context);
}

void TestFieldsAreQuoted() {
  auto& out = CaptureLog();
  FLIGHTLINE_LOG_INFO("loaded", {StringField("file", "raw/flights.csv"), IntField("rows", 12),
                                 StringField("error", "bad \"row\""), StringField("empty", "")});
  spdlog::default_logger()->flush();
  assert(out.str() == "loaded file=raw/flights.csv rows=12 error=\"bad \\\"row\\\"\" empty=\"\"\n");
}

void TestStageScopeTagsLines() {
  auto& out = CaptureLog();
  {
    StageLogScope outer("flights");
    FLIGHTLINE_LOG_INFO("a");
    {
      StageLogScope inner("weather");
      FLIGHTLINE_LOG_INFO("b");
    }
    FLIGHTLINE_LOG_INFO("c", {IntField("n", 1)});
  }
  FLIGHTLINE_LOG_INFO("d");
  spdlog::default_logger()->flush();
  assert(out.str() == "a stage=flights\nb stage=weather\nc stage=flights n=1\nd\n");
}

void TestStageScopeIsPerThread() {
  auto& out = CaptureLog();
  StageLogScope scope("carriers");
  std::thread([] { FLIGHTLINE_LOG_INFO("other"); }).join();
  spdlog::default_logger()->flush();
  assert(out.str() == "other\n");
}

void TestLevelFiltering() {
  auto& out = CaptureLog();
  spdlog::default_logger()->set_level(spdlog::level::warn);
  FLIGHTLINE_LOG_INFO("hidden");
  FLIGHTLINE_LOG_WARN("shown");
  spdlog::default_logger()->set_level(spdlog::level::debug);
  spdlog::default_logger()->flush();
  assert(out.str() == "shown\n");
}

} // namespace

int main() {
  TestSettingsPreferEnvironment();
  TestFieldsAreQuoted();
  TestStageScopeTagsLines();
  TestStageScopeIsPerThread();
  TestLevelFiltering();
  std::cout << "flightline_unit_logging: pass\n";
  return 0;
}
