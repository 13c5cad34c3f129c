#include "raw_uploader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace flightline::pipeline {

namespace fs = std::filesystem;

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool IsCsv(const fs::path& path) {
  return Lower(path.extension().string()) == ".csv";
}

// Regular files of dir, by name.
std::vector<fs::path> ListFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  std::error_code       ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file()) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw util::StorageError("list " + dir.string() + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

RawUploader::RawUploader(std::shared_ptr<storage::ObjectStore> store, flightline::runtime::config::StorageConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
}

void RawUploader::UploadOne(const std::string& local_path, const std::string& key, std::vector<std::string>& uploaded) {
  if (store_->Exists(key)) {
    FLIGHTLINE_LOG_DEBUG("raw object present", {observability::StringField("key", key)});
    return;
  }
  store_->Upload(local_path, key);
  uploaded.push_back(key);
  FLIGHTLINE_LOG_INFO("raw file uploaded", {observability::StringField("file", local_path), observability::StringField("key", key)});
}

std::vector<std::string> RawUploader::Run() {
  std::vector<std::string> uploaded;

  if (config_.local_raw_dir().empty()) {
    FLIGHTLINE_LOG_INFO("no local raw directory configured; upload skipped");
    return uploaded;
  }

  observability::SpanScope span("pipeline.upload");

  const fs::path raw_dir(config_.local_raw_dir());
  if (!fs::is_directory(raw_dir)) {
    throw util::StorageError("local raw directory missing: " + raw_dir.string());
  }

  for (const auto& path : ListFiles(raw_dir)) {
    const auto name = path.filename().string();
    if (IsCsv(path) && Lower(name).find("airport") == std::string::npos) {
      UploadOne(path.string(), config_.fact_prefix() + name, uploaded);
    }
  }

  const auto airports = raw_dir / "airports.dat";
  if (fs::is_regular_file(airports)) {
    UploadOne(airports.string(), config_.airports_key(), uploaded);
  }

  const auto weather_dir = raw_dir / "weather";
  if (fs::is_directory(weather_dir)) {
    for (const auto& path : ListFiles(weather_dir)) {
      if (IsCsv(path)) {
        UploadOne(path.string(), config_.weather_prefix() + path.filename().string(), uploaded);
      }
    }
  }

  std::sort(uploaded.begin(), uploaded.end());
  span.SetAttribute("uploaded", static_cast<int64_t>(uploaded.size()));
  FLIGHTLINE_LOG_INFO("raw upload finished", {observability::IntField("uploaded", static_cast<int64_t>(uploaded.size()))});
  return uploaded;
}

} // namespace flightline::pipeline
