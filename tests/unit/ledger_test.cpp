#include "internal/ledger/ledger.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "support/faulty_repository.hpp"
#include "support/fixtures.hpp"

namespace {

using flightline::db::memory::MemoryRepository;
using flightline::db::model::RunStatus;
using flightline::ledger::IsFactFileKey;
using flightline::ledger::Ledger;
using flightline::testing::LocalStore;
using flightline::testing::TempDir;

void TestFactFileClassification() {
  assert(IsFactFileKey("raw/flights_2024_01.csv", "raw/"));
  assert(IsFactFileKey("raw/FLIGHTS.CSV", "raw/"));
  assert(!IsFactFileKey("raw/airports.csv", "raw/"));
  assert(!IsFactFileKey("raw/Big_Airport_List.csv", "raw/"));
  assert(!IsFactFileKey("raw/airports.dat", "raw/"));
  assert(!IsFactFileKey("raw/notes.txt", "raw/"));
  assert(!IsFactFileKey("weather/KATL.csv", "raw/"));
}

void TestPendingExcludesOnlyCompletedFiles() {
  TempDir dir("ledger_pending");
  auto    store = LocalStore(dir.path());
  auto    repo  = std::make_shared<MemoryRepository>();

  store->Write("raw/flights_2024_01.csv", "x");
  store->Write("raw/flights_2024_02.csv", "x");
  store->Write("raw/flights_2024_03.csv", "x");
  store->Write("raw/airports.dat", "x");
  store->Write("raw/airport_codes.csv", "x");

  Ledger ledger(repo, store, "raw/");
  assert(ledger.ListFactFiles().size() == 3);
  assert(ledger.PendingFiles("flights").size() == 3);

  auto done = ledger.Begin("flights_2024_01.csv", "flights");
  done.rows_processed = 10;
  done.rows_loaded    = 9;
  done.rows_rejected  = 1;
  ledger.Complete(done);

  auto broken = ledger.Begin("flights_2024_02.csv", "flights");
  assert(ledger.Fail(broken, "disk on fire"));

  (void)ledger.Begin("flights_2024_03.csv", "flights");

  const auto pending = ledger.PendingFiles("flights");
  assert(pending.size() == 2);
  assert(pending[0] == "raw/flights_2024_02.csv");
  assert(pending[1] == "raw/flights_2024_03.csv");

  // completion is tracked per source
  assert(ledger.PendingFiles("weather").size() == 3);
  assert(ledger.CompletedFiles("flights") == std::set<std::string>{"flights_2024_01.csv"});

  auto tx     = repo->Begin();
  auto failed = repo->GetPipelineRun(*tx, "flights_2024_02.csv", "flights");
  tx->Commit();
  assert(failed.has_value());
  assert(failed->status == RunStatus::Failed);
  assert(failed->error_message == "disk on fire");
}

void TestCompleteRequiresBalancedCounts() {
  TempDir dir("ledger_counts");
  auto    repo = std::make_shared<MemoryRepository>();
  Ledger  ledger(repo, LocalStore(dir.path()), "raw/");

  auto run = ledger.Begin("f.csv", "flights");
  run.rows_processed = 10;
  run.rows_loaded    = 8;
  run.rows_rejected  = 1;

  bool threw = false;
  try {
    ledger.Complete(run);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.CompletedFiles("flights").empty());
}

void TestRerunUpsertsSingleRow() {
  TempDir dir("ledger_upsert");
  auto    repo = std::make_shared<MemoryRepository>();
  Ledger  ledger(repo, LocalStore(dir.path()), "raw/");

  auto first = ledger.Begin("f.csv", "flights");
  assert(ledger.Fail(first, "boom"));

  auto second           = ledger.Begin("f.csv", "flights");
  second.rows_processed = 3;
  second.rows_loaded    = 3;
  ledger.Complete(second);

  auto tx  = repo->Begin();
  auto row = repo->GetPipelineRun(*tx, "f.csv", "flights");
  auto all = repo->ListCompletedFiles(*tx, "flights");
  tx->Commit();

  assert(all.size() == 1);
  assert(row->status == RunStatus::Completed);
  assert(row->rows_loaded == 3);
  assert(row->error_message.empty());
  assert(row->completed_at_ms >= row->started_at_ms);
}

void TestLatestCompletedByCompletionTime() {
  TempDir dir("ledger_latest");
  auto    repo = std::make_shared<MemoryRepository>();
  Ledger  ledger(repo, LocalStore(dir.path()), "raw/");

  assert(!ledger.LatestCompleted("flights"));

  auto a           = ledger.Begin("a.csv", "flights");
  a.rows_processed = 1;
  a.rows_loaded    = 1;
  ledger.Complete(a);

  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  auto b            = ledger.Begin("b.csv", "flights");
  b.rows_processed  = 2;
  b.rows_rejected   = 2;
  ledger.Complete(b);

  auto latest = ledger.LatestCompleted("flights");
  assert(latest && latest->file_name == "b.csv");
  assert(!ledger.LatestCompleted("airports"));
}

void TestFailReportsUnreachableLedger() {
  TempDir dir("ledger_unreachable");
  auto    faulty = std::make_shared<flightline::testing::FaultyRepository>(std::make_shared<MemoryRepository>());
  Ledger  ledger(faulty, LocalStore(dir.path()), "raw/");

  auto run = ledger.Begin("f.csv", "flights");
  faulty->fail_ledger = true;
  assert(!ledger.Fail(run, "original error"));
  assert(run.status == RunStatus::Failed);
}

} // namespace

int main() {
  TestFactFileClassification();
  TestPendingExcludesOnlyCompletedFiles();
  TestCompleteRequiresBalancedCounts();
  TestRerunUpsertsSingleRow();
  TestLatestCompletedByCompletionTime();
  TestFailReportsUnreachableLedger();

  std::cout << "flightline_unit_ledger: pass\n";
  return 0;
}
