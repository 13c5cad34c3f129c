#include "internal/fact/fact_loader.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dimension/date_dim.hpp"
#include "internal/util/errors.hpp"
#include "support/faulty_repository.hpp"
#include "support/fixtures.hpp"

namespace {

using flightline::db::Table;
using flightline::db::memory::MemoryRepository;
using flightline::db::model::RunStatus;
using flightline::fact::FactLoader;
using flightline::ledger::Ledger;
using flightline::testing::FactCsv;
using flightline::testing::FactRow;
using flightline::testing::LocalStore;
using flightline::testing::TempDir;

constexpr const char* kFile = "raw/flights_2024_01.csv";

// 100 rows over three days; rows 7, 27, 47, 67, 87 have an unknown origin.
std::vector<FactRow> HundredRows() {
  static const char* kDays[] = {"2024-01-15", "2024-01-16", "2024-01-17"};
  std::vector<FactRow> rows;
  for (int i = 0; i < 100; ++i) {
    FactRow row;
    row.date          = kDays[i % 3];
    row.carrier       = i % 2 == 0 ? "DL" : "AA";
    row.flight_number = std::to_string(1000 + i);
    row.origin        = i % 20 == 7 ? "XXX" : "ATL";
    row.dest          = i % 4 == 0 ? "LAX" : "ORD";
    row.arr_delay     = std::to_string(i - 10) + ".00";
    rows.push_back(row);
  }
  return rows;
}

struct Harness {
  TempDir                                                dir{"fact_loader"};
  std::shared_ptr<MemoryRepository>                      memory = std::make_shared<MemoryRepository>();
  std::shared_ptr<flightline::testing::FaultyRepository> repo =
      std::make_shared<flightline::testing::FaultyRepository>(memory);
  std::shared_ptr<flightline::storage::ArrowObjectStore> store  = LocalStore(dir.path());
  std::shared_ptr<Ledger>                                ledger = std::make_shared<Ledger>(repo, store, "raw/");

  Harness() {
    flightline::testing::SeedAirports(*repo, {"ATL", "ORD", "LAX"});
    flightline::testing::SeedCarriers(*repo, {"DL", "AA"});
  }

  uint64_t Count(Table table) {
    auto tx = repo->Begin();
    auto n  = repo->CountRows(*tx, table);
    tx->Commit();
    return n;
  }

  flightline::db::model::PipelineRunRecord Run(const std::string& file) {
    auto tx  = repo->Begin();
    auto run = repo->GetPipelineRun(*tx, file, "flights");
    tx->Commit();
    assert(run.has_value());
    return *run;
  }
};

void TestLoadCountsAndRejects() {
  Harness h;
  h.store->Write(kFile, FactCsv(HundredRows()));

  FactLoader loader(h.repo, h.store, h.ledger, 50000);
  const auto summary = loader.Run();

  assert(summary.files.size() == 1);
  assert(summary.loaded == 95);
  assert(summary.rejected == 5);
  assert(summary.files[0].processed == 100);
  assert(summary.files[0].chunks == 1);

  const auto run = h.Run("flights_2024_01.csv");
  assert(run.status == RunStatus::Completed);
  assert(run.rows_processed == 100);
  assert(run.rows_loaded == 95);
  assert(run.rows_rejected == 5);
  assert(run.rows_loaded + run.rows_rejected == run.rows_processed);

  assert(h.Count(Table::Flights) == 95);
  assert(h.Count(Table::DateDim) == 3);

  auto tx      = h.repo->Begin();
  auto rejects = h.repo->ListRejectedRecords(*tx, "flights", "flights_2024_01.csv");
  auto flight  = h.repo->GetFlight(*tx, {"2024-01-15", "DL", 1000, "ATL"});
  tx->Commit();

  assert(rejects.size() == 5);
  assert(rejects[0].row_number == 7);
  assert(rejects[0].raw_data == "2024-01-16,AA,XXX,ORD");
  assert(rejects[0].rejection_reason == "Unknown origin airport: XXX");
  assert(rejects[4].row_number == 87);

  assert(flight.has_value());
  assert(flight->dest_airport == "LAX");
  assert(flight->arr_delay == std::optional<double>(-10.0));
  assert(!flight->cancelled);
}

void TestChunkSizeDoesNotChangeTheOutcome() {
  Harness h;
  h.store->Write(kFile, FactCsv(HundredRows()));

  const auto result = FactLoader(h.repo, h.store, h.ledger, 7).LoadFile(kFile);
  assert(result.chunks == 15);
  assert(result.loaded == 95);
  assert(result.rejected == 5);
  assert(h.Count(Table::Flights) == 95);
  assert(h.Count(Table::RejectedRecords) == 5);
}

void TestSecondRunSkipsCompletedFile() {
  Harness h;
  h.store->Write(kFile, FactCsv(HundredRows()));

  FactLoader loader(h.repo, h.store, h.ledger, 50000);
  (void)loader.Run();
  const auto again = loader.Run();

  assert(again.files.empty());
  assert(h.Count(Table::Flights) == 95);
  assert(h.Count(Table::RejectedRecords) == 5);
}

void TestReloadingAFileDoesNotDuplicateFlights() {
  Harness h;
  h.store->Write(kFile, FactCsv(HundredRows()));

  FactLoader loader(h.repo, h.store, h.ledger, 30);
  (void)loader.LoadFile(kFile);
  const auto second = loader.LoadFile(kFile);

  assert(second.loaded == 95);
  assert(h.Count(Table::Flights) == 95);
  // rejects are appended again on a forced reload
  assert(h.Count(Table::RejectedRecords) == 10);
}

void TestNewDateIsDerivedBeforeValidation() {
  Harness h;
  (void)flightline::dimension::EnsureDates(*h.repo, {"2024-01-15"});

  h.store->Write(kFile, FactCsv({{"2024-01-15", "DL", "1", "ATL", "ORD"}, {"3/16/2024", "DL", "2", "ATL", "ORD"}}));

  const auto result = FactLoader(h.repo, h.store, h.ledger, 100).LoadFile(kFile);
  assert(result.loaded == 2);
  assert(result.rejected == 0);

  auto tx       = h.repo->Begin();
  auto saturday = h.repo->GetDate(*tx, "2024-03-16");
  auto flight   = h.repo->GetFlight(*tx, {"2024-03-16", "DL", 2, "ATL"});
  tx->Commit();

  assert(saturday.has_value());
  assert(saturday->day_of_week == 5);
  assert(saturday->day_name == "Saturday");
  assert(saturday->is_weekend);
  assert(saturday->season == "Spring");
  assert(flight.has_value());
}

void TestNullFlightNumbersCollide() {
  Harness h;
  h.store->Write(kFile, FactCsv({{"2024-01-15", "DL", "", "ATL", "ORD"},
                                 {"2024-01-15", "DL", "", "ATL", "LAX"},
                                 {"2024-01-15", "DL", "77", "ATL", "LAX"}}));

  const auto result = FactLoader(h.repo, h.store, h.ledger, 100).LoadFile(kFile);
  assert(result.loaded == 3);
  assert(h.Count(Table::Flights) == 2);

  auto tx     = h.repo->Begin();
  auto flight = h.repo->GetFlight(*tx, {"2024-01-15", "DL", std::nullopt, "ATL"});
  tx->Commit();
  assert(flight && flight->dest_airport == "ORD");
}

void TestMissingRequiredColumnIsStructural() {
  Harness h;
  h.store->Write(kFile, "FlightDate,Reporting_Airline,Origin\n2024-01-15,DL,ATL\n");

  bool threw = false;
  try {
    (void)FactLoader(h.repo, h.store, h.ledger, 100).Run();
  } catch (const flightline::util::SchemaError& e) {
    threw = std::string(e.what()).find("Dest") != std::string::npos;
  }
  assert(threw);
  assert(h.Count(Table::Flights) == 0);
  assert(h.Run("flights_2024_01.csv").status == RunStatus::Failed);
}

void TestOptionalColumnsMayBeAbsent() {
  Harness h;
  h.store->Write(kFile, "FlightDate,Reporting_Airline,Origin,Dest,ArrDelay\n2024-01-15,DL,ATL,ORD,12\n");

  const auto result = FactLoader(h.repo, h.store, h.ledger, 100).LoadFile(kFile);
  assert(result.loaded == 1);

  auto tx     = h.repo->Begin();
  auto flight = h.repo->GetFlight(*tx, {"2024-01-15", "DL", std::nullopt, "ATL"});
  tx->Commit();
  assert(flight.has_value());
  assert(flight->arr_delay == std::optional<double>(12.0));
  assert(!flight->dep_delay);
  assert(!flight->tail_number);
}

void TestMidFileFailureKeepsEarlierChunksAndRetryCompletes() {
  Harness h;
  h.store->Write(kFile, FactCsv(HundredRows()));
  h.repo->fail_flight_insert_at = 3;

  FactLoader loader(h.repo, h.store, h.ledger, 10);

  bool threw = false;
  try {
    (void)loader.Run();
  } catch (const flightline::util::RepositoryError& e) {
    threw = e.Code() == flightline::db::ErrorCode::IOError;
  }
  assert(threw);

  auto failed = h.Run("flights_2024_01.csv");
  assert(failed.status == RunStatus::Failed);
  assert(!failed.error_message.empty());
  assert(h.Count(Table::Flights) == 19);
  assert(h.Count(Table::RejectedRecords) == 1);
  assert(h.ledger->PendingFiles("flights").size() == 1);

  h.repo->fail_flight_insert_at = 0;
  const auto retry              = loader.Run();
  assert(retry.loaded == 95);
  assert(retry.rejected == 5);

  const auto done = h.Run("flights_2024_01.csv");
  assert(done.status == RunStatus::Completed);
  assert(done.rows_processed == 100);
  assert(h.Count(Table::Flights) == 95);
  // the retried file logs its rejects again
  assert(h.Count(Table::RejectedRecords) == 6);
}

void TestFilesLoadInKeyOrder() {
  Harness h;
  h.store->Write("raw/flights_2024_02.csv", FactCsv({{"2024-02-01", "DL", "1", "ATL", "ORD"}}));
  h.store->Write("raw/flights_2024_01.csv", FactCsv({{"2024-01-01", "DL", "1", "ATL", "ORD"}}));
  h.store->Write("raw/airports_extra.csv", FactCsv({{"2024-03-01", "DL", "1", "ATL", "ORD"}}));

  const auto summary = FactLoader(h.repo, h.store, h.ledger, 100).Run();
  assert(summary.files.size() == 2);
  assert(summary.files[0].file_name == "flights_2024_01.csv");
  assert(summary.files[1].file_name == "flights_2024_02.csv");
}

} // namespace

int main() {
  TestLoadCountsAndRejects();
  TestChunkSizeDoesNotChangeTheOutcome();
  TestSecondRunSkipsCompletedFile();
  TestReloadingAFileDoesNotDuplicateFlights();
  TestNewDateIsDerivedBeforeValidation();
  TestNullFlightNumbersCollide();
  TestMissingRequiredColumnIsStructural();
  TestOptionalColumnsMayBeAbsent();
  TestMidFileFailureKeepsEarlierChunksAndRetryCompletes();
  TestFilesLoadInKeyOrder();

  std::cout << "flightline_unit_fact_loader: pass\n";
  return 0;
}
