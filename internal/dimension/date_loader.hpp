#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/storage/object_store.hpp"

namespace flightline::dimension {

// Distinct canonical FlightDate values of one fact file. Unparsable values are skipped.
std::set<std::string> ScanFlightDates(storage::ObjectStore& store, const std::string& key, std::size_t chunk_rows);

/*
  DateLoader

  Unions the FlightDate values of every pending fact file and inserts
  the derived date_dim rows with conflict = do nothing.
*/
class DateLoader {
 public:
  DateLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
             std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_rows);

  std::set<std::string> CollectDates();

  // Returns the number of distinct dates offered to the warehouse.
  uint64_t Run();

 private:
  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::shared_ptr<ledger::Ledger>       ledger_;
  std::size_t                           chunk_rows_;
};

} // namespace flightline::dimension
