#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace flightline::config {

using flightline::runtime::config::RuntimeConfig;

namespace {

// Busiest US airports with an ASOS station named K<IATA>.
constexpr std::array<std::string_view, 30> kDefaultWeatherAirports = {
    "ATL", "DFW", "DEN", "ORD", "LAX", "JFK", "LAS", "MCO", "MIA", "CLT", "SEA", "PHX", "EWR", "SFO", "IAH",
    "BOS", "FLL", "MSP", "LGA", "DTW", "PHL", "SLC", "DCA", "SAN", "BWI", "TPA", "AUS", "IAD", "BNA", "MDW"};

bool IsBool(const std::string& s, bool& out) {
  if (s == "true" || s == "True") {
    out = true;
    return true;
  }
  if (s == "false" || s == "False") {
    out = false;
    return true;
  }
  return false;
}

bool IsNumber(const std::string& s, double& out) {
  if (s.empty()) {
    return false;
  }
  char* end = nullptr;
  out       = std::strtod(s.c_str(), &end);
  return end != nullptr && *end == '\0' && std::isfinite(out);
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;

  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    const auto& text = node.Scalar();
    bool        flag   = false;
    double      number = 0;
    // a quoted scalar ("120s", "0042") always stays a string
    if (node.Tag() == "!") {
      value.set_string_value(text);
    } else if (IsBool(text, flag)) {
      value.set_bool_value(flag);
    } else if (IsNumber(text, number)) {
      value.set_number_value(number);
    } else {
      value.set_string_value(text);
    }
  } else if (node.IsSequence()) {
    auto* list = value.mutable_list_value();
    for (const auto& item : node) {
      *list->add_values() = ToValue(item);
    }
  } else if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      fields[entry.first.as<std::string>()] = ToValue(entry.second);
    }
  } else {
    throw std::runtime_error("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
  return value;
}

RuntimeConfig FromYaml(const YAML::Node& root) {
  RuntimeConfig config;
  if (!root.IsNull()) {
    if (!root.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    std::string json;
    auto        printed = google::protobuf::util::MessageToJsonString(ToValue(root), &json);
    if (!printed.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(printed.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    auto parsed                   = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!parsed.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  try {
    ConfigLoader::Validate(config);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }
  return config;
}

} // namespace

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->root_uri().empty()) storage->set_root_uri("s3://flight-data");
  if (storage->fact_prefix().empty()) storage->set_fact_prefix("raw/");
  if (storage->airports_key().empty()) storage->set_airports_key("raw/airports.dat");
  if (storage->weather_prefix().empty()) storage->set_weather_prefix("weather/");

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->chunk_size() == 0) pipeline->set_chunk_size(50000);
  if (!pipeline->has_max_rejection_rate()) pipeline->set_max_rejection_rate(0.05);
  if (!pipeline->has_delay_floor()) pipeline->set_delay_floor(-150.0);
  if (!pipeline->has_delay_ceiling()) pipeline->set_delay_ceiling(5000.0);
  if (!pipeline->has_max_retries()) pipeline->set_max_retries(2);
  if (!pipeline->has_retry_delay()) pipeline->mutable_retry_delay()->set_seconds(120);
  if (!pipeline->has_parallel_dimensions()) pipeline->set_parallel_dimensions(true);

  auto* weather = config.mutable_weather();
  if (weather->source_name().empty()) weather->set_source_name("asos_hourly_weather");
  if (weather->airport_stations().empty()) {
    auto& stations = *weather->mutable_airport_stations();
    for (auto airport : kDefaultWeatherAirports) {
      stations[std::string(airport)] = "K" + std::string(airport);
    }
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (!config.logging().level().empty() &&
      spdlog::level::from_str(config.logging().level()) == spdlog::level::off && config.logging().level() != "off") {
    throw std::invalid_argument("logging.level: unknown level " + config.logging().level());
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must not be empty");
  }

  const auto& pipeline = config.pipeline();
  if (pipeline.max_rejection_rate() < 0.0 || pipeline.max_rejection_rate() > 1.0) {
    throw std::invalid_argument("pipeline.max_rejection_rate must be within [0, 1]");
  }
  if (pipeline.delay_floor() > pipeline.delay_ceiling()) {
    throw std::invalid_argument("pipeline.delay_floor must not exceed pipeline.delay_ceiling");
  }
  if (pipeline.retry_delay().seconds() < 0 || pipeline.retry_delay().nanos() < 0) {
    throw std::invalid_argument("pipeline.retry_delay must not be negative");
  }

  for (const auto& [airport, station] : config.weather().airport_stations()) {
    if (airport.size() != 3 || station.empty()) {
      throw std::invalid_argument("weather.airport_stations: bad entry " + airport + " -> " + station);
    }
  }
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYaml(root);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYaml(root);
}

} // namespace flightline::config
