#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/storage/object_store.hpp"

namespace flightline::pipeline {

/*
  RawUploader

  Copies the local raw directory into object storage:

    <local_raw_dir>/<name>.csv          -> <fact_prefix><name>.csv  (names without "airport")
    <local_raw_dir>/airports.dat        -> <airports_key>
    <local_raw_dir>/weather/<name>.csv  -> <weather_prefix><name>.csv

  Keys already present are left untouched. An empty local_raw_dir
  disables the stage.
*/
class RawUploader {
 public:
  RawUploader(std::shared_ptr<storage::ObjectStore> store, flightline::runtime::config::StorageConfig config);

  // Keys written by this run, ascending.
  std::vector<std::string> Run();

 private:
  void UploadOne(const std::string& local_path, const std::string& key, std::vector<std::string>& uploaded);

  std::shared_ptr<storage::ObjectStore>       store_;
  flightline::runtime::config::StorageConfig config_;
};

} // namespace flightline::pipeline
