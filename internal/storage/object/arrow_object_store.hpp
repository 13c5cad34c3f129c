#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace flightline::runtime::config {
class StorageConfig;
}

namespace flightline::storage {

/*
  ObjectStore over an Arrow filesystem.

  Object key layout:

      <root_path>/<key>

  The same class serves local directories (tests, single host) and
  S3-compatible buckets.
*/

class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  static std::shared_ptr<ArrowObjectStore> FromConfig(const flightline::runtime::config::StorageConfig& config);

  std::vector<std::string> List(const std::string& prefix) override;

  bool Exists(const std::string& key) override;

  std::shared_ptr<arrow::io::InputStream> OpenInputStream(const std::string& key) override;

  void Upload(const std::filesystem::path& local_path, const std::string& key) override;

  void Write(const std::string& key, std::string_view data) override;

  const std::string& RootPath() const {
    return root_path_;
  }

 private:
  std::string ObjectPath(const std::string& key) const;
  void        EnsureParent(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace flightline::storage
