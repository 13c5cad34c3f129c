#pragma once

#include <arrow/io/interfaces.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flightline::storage {

/*
  Raw-data object storage.

  Keys are relative to the configured root ("raw/flights_2024_01.csv").
  Every failure surfaces as util::StorageError.

  Implementations:
    ArrowObjectStore → local directory or S3 / MinIO through arrow::fs
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  /*
    Keys of files directly under a prefix, ascending.

    A prefix ending in '/' names a directory; otherwise its last
    segment also filters file names ("raw/flights_" matches
    "raw/flights_2024.csv"). A missing directory lists empty.
  */
  virtual std::vector<std::string> List(const std::string& prefix) = 0;

  virtual bool Exists(const std::string& key) = 0;

  virtual std::shared_ptr<arrow::io::InputStream> OpenInputStream(const std::string& key) = 0;

  // Copy a local file into the store, streaming.
  virtual void Upload(const std::filesystem::path& local_path, const std::string& key) = 0;

  virtual void Write(const std::string& key, std::string_view data) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace flightline::storage
