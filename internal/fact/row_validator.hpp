#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/csv/csv_reader.hpp"

namespace flightline::fact {

/*
  Dimension keys a fact file is validated against. Taken once per file
  and passed by const reference into validation.
*/
struct DimensionSnapshot {
  std::unordered_set<std::string> airports;
  std::unordered_set<std::string> carriers;
  std::unordered_set<std::string> dates;

  // Reads all three key sets in one transaction.
  static DimensionSnapshot Load(db::Repository& repo);
};

struct RowVerdict {
  bool                     accepted = false;
  std::vector<std::string> reasons;

  std::string raw_data;    // "<date>,<carrier>,<origin>,<dest>" as read, trimmed
  std::string flight_date; // canonical date_id, empty when unparsable

  std::string Reason() const;
};

/*
  Referential checks of one fact row (projected with FactColumns()).
  Every failing check contributes a reason, in the order origin,
  destination, carrier, date.
*/
RowVerdict ValidateRow(const storage::csv::CsvRow& row, const DimensionSnapshot& snapshot);

} // namespace flightline::fact
