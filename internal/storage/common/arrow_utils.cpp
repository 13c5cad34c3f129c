#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <filesystem>
#include <mutex>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace flightline::storage::common {

namespace {

std::once_flag g_s3_init;
bool           g_s3_initialized = false;

bool IsS3Uri(const std::string& uri) {
  return uri.rfind("s3://", 0) == 0;
}

bool IsUri(const std::string& uri) {
  return uri.find("://") != std::string::npos;
}

arrow::Status InitializeS3Once() {
  arrow::Status status;
  std::call_once(g_s3_init, [&status] {
    status = arrow::fs::EnsureS3Initialized();
    g_s3_initialized = status.ok();
  });
  return status;
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& root_uri, const flightline::runtime::config::S3Config& s3_config) {
  std::string resolved_path;

  if (IsS3Uri(root_uri)) {
    ARROW_RETURN_NOT_OK(InitializeS3Once());

    ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(root_uri, &resolved_path));
    if (!s3_config.region().empty()) {
      options.region = s3_config.region();
    }
    if (!s3_config.endpoint_override().empty()) {
      options.endpoint_override = s3_config.endpoint_override();
    }
    if (!s3_config.scheme().empty()) {
      options.scheme = s3_config.scheme();
    }
    if (!s3_config.access_key().empty()) {
      options.ConfigureAccessKey(s3_config.access_key(), s3_config.secret_key());
    }

    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
  }

  if (IsUri(root_uri)) {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(root_uri, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  // LocalFileSystem only accepts absolute paths
  std::error_code ec;
  auto            absolute = std::filesystem::absolute(root_uri.empty() ? "." : root_uri, ec);
  if (ec) {
    return arrow::Status::IOError("cannot resolve local root ", root_uri, ": ", ec.message());
  }
  resolved_path = absolute.lexically_normal().generic_string();
  if (resolved_path.size() > 1 && resolved_path.back() == '/') {
    resolved_path.pop_back();
  }
  return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()),
                        resolved_path);
}

void FinalizeFileSystems() {
  if (!g_s3_initialized) {
    return;
  }
  auto status = arrow::fs::FinalizeS3();
  if (!status.ok()) {
    FLIGHTLINE_LOG_WARN("arrow s3 finalize failed", {observability::StringField("error", status.ToString())});
  }
  g_s3_initialized = false;
}

} // namespace flightline::storage::common
