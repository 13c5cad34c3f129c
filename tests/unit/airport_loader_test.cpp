#include "internal/dimension/airport_loader.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using flightline::db::memory::MemoryRepository;
using flightline::db::model::RunStatus;
using flightline::dimension::AirportLoader;
using flightline::ledger::Ledger;
using flightline::testing::LocalStore;
using flightline::testing::TempDir;

constexpr const char* kAirportsDat =
    R"(3682,"Hartsfield Jackson Atlanta International Airport","Atlanta","United States","ATL","KATL",33.6367,-84.428101,1026,-5,"A","America/New_York","airport","OurAirports"
9999,"Atlanta Duplicate","Elsewhere","Nowhere","ATL","KXXX",1.0,2.0,3,-5,"A","Etc/UTC","airport","OurAirports"
5,"No Iata Field","Town","Country",\N,"ABCD",1.0,2.0,3,0,"U",\N,"airport","OurAirports"
6,"Four Letter Code","Town","Country","ABCD","ABCD",1.0,2.0,3,0,"U","Etc/UTC","airport","OurAirports"
3830,"Chicago O'Hare International Airport","Chicago","United States","ORD","KORD",41.9786,-87.9048,672,-6,"A","America/Chicago","airport","OurAirports"
)";

struct Harness {
  TempDir                           dir{"airport_loader"};
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<flightline::storage::ArrowObjectStore> store = LocalStore(dir.path());
  std::shared_ptr<Ledger>           ledger = std::make_shared<Ledger>(repo, store, "raw/");
};

void TestFirstOccurrenceWinsAndShortCodesAreKept() {
  Harness h;
  h.store->Write("raw/airports.dat", kAirportsDat);

  AirportLoader loader(h.repo, h.store, h.ledger, "raw/airports.dat");
  const auto    result = loader.Run();

  assert(result.rows_read == 5);
  assert(result.loaded == 2);
  assert(result.rejected == 3);

  auto tx    = h.repo->Begin();
  auto codes = h.repo->ListAirportCodes(*tx);
  auto atl   = h.repo->GetAirport(*tx, "ATL");
  auto ord   = h.repo->GetAirport(*tx, "ORD");
  auto run   = h.repo->GetPipelineRun(*tx, "airports.dat", "airports");
  tx->Commit();

  assert((codes == std::vector<std::string>{"ATL", "ORD"}));
  assert(atl->airport_name == "Hartsfield Jackson Atlanta International Airport");
  assert(atl->city == std::optional<std::string>("Atlanta"));
  assert(atl->latitude && *atl->latitude > 33.6 && *atl->latitude < 33.7);
  assert(atl->altitude == std::optional<int64_t>(1026));
  assert(atl->timezone == std::optional<std::string>("America/New_York"));
  assert(ord->airport_name == "Chicago O'Hare International Airport");

  assert(run && run->status == RunStatus::Completed);
  assert(run->rows_processed == 5);
  assert(run->rows_loaded == 2);
  assert(run->rows_rejected == 3);
}

void TestRerunLeavesExistingRowsUntouched() {
  Harness h;
  h.store->Write("raw/airports.dat", kAirportsDat);
  AirportLoader(h.repo, h.store, h.ledger, "raw/airports.dat").Run();

  h.store->Write("raw/airports.dat",
                 R"(1,"Renamed Atlanta","Atlanta","United States","ATL","KATL",0,0,0,-5,"A","America/New_York","airport","OurAirports"
)");
  AirportLoader(h.repo, h.store, h.ledger, "raw/airports.dat").Run();

  auto tx  = h.repo->Begin();
  auto atl = h.repo->GetAirport(*tx, "ATL");
  auto n   = h.repo->CountRows(*tx, flightline::db::Table::Airports);
  tx->Commit();
  assert(atl->airport_name == "Hartsfield Jackson Atlanta International Airport");
  assert(n == 2);
}

void TestMissingReferenceIsStorageError() {
  Harness h;

  bool threw = false;
  try {
    AirportLoader(h.repo, h.store, h.ledger, "raw/airports.dat").Run();
  } catch (const flightline::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFirstOccurrenceWinsAndShortCodesAreKept();
  TestRerunLeavesExistingRowsUntouched();
  TestMissingReferenceIsStorageError();

  std::cout << "flightline_unit_airport_loader: pass\n";
  return 0;
}
