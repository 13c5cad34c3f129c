#pragma once

#include <cstdint>
#include <string>

namespace flightline::db::model {

/*
  Append-only audit row for a source row that failed referential checks.
  No dedup key: re-validating a file logs its rejects again.
*/
struct RejectedRecord {
  std::string source;
  std::string file_name;
  uint64_t    row_number = 0; // 0-based data row index within the file
  std::string raw_data;       // "<date>,<carrier>,<origin>,<dest>"
  std::string rejection_reason;
};

} // namespace flightline::db::model
