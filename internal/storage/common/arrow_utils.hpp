#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace flightline::runtime::config {
class S3Config;
}

namespace flightline::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

/*
  Resolve a storage root into (filesystem, root path).

    /data/raw, ./raw      -> LocalFileSystem, absolute path
    s3://bucket[/prefix]  -> S3FileSystem built from S3Config
    other URIs            -> arrow::fs::FileSystemFromUri
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& root_uri, const flightline::runtime::config::S3Config& s3_config);

// Arrow S3 support is process-global; safe to call repeatedly.
void FinalizeFileSystems();

} // namespace flightline::storage::common
