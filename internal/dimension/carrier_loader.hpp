#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger.hpp"
#include "internal/storage/object_store.hpp"

namespace flightline::dimension {

// Known US carrier name, else "Carrier <code>".
std::string CarrierName(const std::string& code);

/*
  CarrierLoader

  Scans Reporting_Airline / DOT_ID_Reporting_Airline of every pending
  fact file and inserts the distinct carrier set before any fact row is
  validated. The first dot_id seen for a code (files in key order, rows
  in file order) wins.
*/
class CarrierLoader {
 public:
  CarrierLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_rows);

  // code -> dot_id across all pending fact files, ordered by code
  std::map<std::string, std::optional<int64_t>> CollectCarriers();

  // Returns the number of distinct carriers offered to the warehouse.
  uint64_t Run();

 private:
  std::shared_ptr<db::Repository>      repo_;
  std::shared_ptr<storage::ObjectStore> store_;
  std::shared_ptr<ledger::Ledger>       ledger_;
  std::size_t                           chunk_rows_;
};

} // namespace flightline::dimension
