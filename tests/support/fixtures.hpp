#pragma once

#include <arrow/filesystem/localfs.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/fact/flight_row.hpp"
#include "internal/storage/object/arrow_object_store.hpp"

namespace flightline::testing {

// Scratch directory removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& name) {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("flightline_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
  out.close();
  assert(out.good());
}

inline std::shared_ptr<storage::ArrowObjectStore> LocalStore(const std::filesystem::path& root) {
  return std::make_shared<storage::ArrowObjectStore>(std::make_shared<arrow::fs::LocalFileSystem>(),
                                                     root.lexically_normal().generic_string());
}

// One BTS on-time row. Empty strings are written as empty fields.
struct FactRow {
  std::string date;
  std::string carrier;
  std::string flight_number;
  std::string origin;
  std::string dest;
  std::string dep_delay = "0.00";
  std::string arr_delay = "0.00";
  std::string cancelled = "0.00";
};

inline std::string FactHeader() {
  std::string line;
  for (const auto& column : fact::FactColumns()) {
    line += line.empty() ? column : "," + column;
  }
  return line + "\n";
}

inline std::string FactLine(const FactRow& row) {
  std::vector<std::string> cols(fact::kFactColumnCount);
  cols[fact::kFlightDate]        = row.date;
  cols[fact::kReportingAirline]  = row.carrier;
  cols[fact::kTailNumber]        = "N100" + row.carrier;
  cols[fact::kFlightNumber]      = row.flight_number;
  cols[fact::kOrigin]            = row.origin;
  cols[fact::kOriginState]       = "GA";
  cols[fact::kDest]              = row.dest;
  cols[fact::kDestState]         = "IL";
  cols[fact::kCrsDepTime]        = "0800";
  cols[fact::kDepTime]           = "0805";
  cols[fact::kDepDelay]          = row.dep_delay;
  cols[fact::kDepDel15]          = "0.00";
  cols[fact::kCrsArrTime]        = "0930";
  cols[fact::kArrDelay]          = row.arr_delay;
  cols[fact::kArrDel15]          = "0.00";
  cols[fact::kCancelled]         = row.cancelled;
  cols[fact::kDiverted]          = "0.00";
  cols[fact::kDistance]          = "606.00";
  cols[fact::kCrsElapsedTime]    = "130.00";
  cols[fact::kActualElapsedTime] = "125.00";

  std::string line;
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (i > 0) line += ",";
    line += cols[i];
  }
  return line + "\n";
}

inline std::string FactCsv(const std::vector<FactRow>& rows) {
  std::string csv = FactHeader();
  for (const auto& row : rows) {
    csv += FactLine(row);
  }
  return csv;
}

inline void SeedAirports(db::Repository& repo, const std::vector<std::string>& codes) {
  std::vector<db::model::AirportRecord> records;
  for (const auto& code : codes) {
    db::model::AirportRecord r;
    r.airport_code = code;
    r.airport_name = code + " International";
    records.push_back(std::move(r));
  }
  auto tx = repo.Begin();
  const auto result = repo.InsertAirports(*tx, records);
  assert(result);
  tx->Commit();
}

inline void SeedCarriers(db::Repository& repo, const std::vector<std::string>& codes) {
  std::vector<db::model::CarrierRecord> records;
  for (const auto& code : codes) {
    records.push_back({code, "Carrier " + code, std::nullopt});
  }
  auto tx = repo.Begin();
  const auto result = repo.InsertCarriers(*tx, records);
  assert(result);
  tx->Commit();
}

} // namespace flightline::testing
