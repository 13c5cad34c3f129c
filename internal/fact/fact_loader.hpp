#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/fact/row_validator.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/storage/object_store.hpp"

namespace flightline::fact {

struct FileLoadResult {
  std::string file_name;
  uint64_t    processed = 0;
  uint64_t    loaded    = 0;
  uint64_t    rejected  = 0;
  uint64_t    chunks    = 0;
};

struct FactLoadSummary {
  std::vector<FileLoadResult> files;
  uint64_t                    loaded   = 0;
  uint64_t                    rejected = 0;
};

/*
  FactLoader

  Loads every pending fact file in key order. Per file:

    1. header check for the required columns (SchemaError)
    2. ledger row -> running
    3. dimension snapshot; dates of the file missing from date_dim
       are derived, inserted and added to the snapshot
    4. fixed-size chunks, each committed in its own transaction:
         accepted rows -> flights (conflict do nothing)
         rejected rows -> rejected_records (append)
    5. ledger row -> completed with final counters

  A failure aborts the file: committed chunks stay, the ledger row is
  marked failed and the error is rethrown. The next run re-validates
  the whole file.
*/
class FactLoader {
 public:
  FactLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
             std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_size);

  FactLoadSummary Run();

  FileLoadResult LoadFile(const std::string& key);

 private:
  void RequireColumns(const std::string& key);
  void MergeFileDates(const std::string& key, DimensionSnapshot& snapshot);
  void CommitChunk(const std::string& key, uint64_t chunk_index, const std::vector<db::model::FlightRecord>& accepted,
                   const std::vector<db::model::RejectedRecord>& rejected);

  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::shared_ptr<ledger::Ledger>       ledger_;
  std::size_t                           chunk_size_;
};

} // namespace flightline::fact
