#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/storage/csv/csv_reader.hpp"
#include "internal/storage/object_store.hpp"

namespace flightline::dimension {

// OpenFlights airports.dat layout (headerless).
const std::vector<std::string>& AirportFileColumns();

struct AirportLoadResult {
  uint64_t rows_read = 0;
  uint64_t loaded    = 0; // unique rows with a three-letter code
  uint64_t rejected  = 0;
};

/*
  Accumulates airports.dat rows: keeps rows whose IATA code is exactly
  three characters, first occurrence of a code wins.
*/
class AirportCollector {
 public:
  // row follows AirportLoader::ProjectedColumns() order
  void Add(const storage::csv::CsvRow& row);

  uint64_t RowsSeen() const {
    return rows_seen_;
  }

  const std::vector<db::model::AirportRecord>& Records() const {
    return records_;
  }

 private:
  uint64_t                              rows_seen_ = 0;
  std::vector<db::model::AirportRecord> records_;
  std::set<std::string>                 seen_;
};

class AirportLoader {
 public:
  AirportLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                std::shared_ptr<ledger::Ledger> ledger, std::string airports_key);

  static const std::vector<std::string>& ProjectedColumns();

  AirportLoadResult Run();

 private:
  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::shared_ptr<ledger::Ledger>       ledger_;
  std::string                           airports_key_;
};

} // namespace flightline::dimension
