#include <arrow/io/interfaces.h>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/storage/object/arrow_object_store.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using flightline::testing::LocalStore;
using flightline::testing::TempDir;
using flightline::testing::WriteFile;

std::string ReadAll(flightline::storage::ObjectStore& store, const std::string& key) {
  auto        stream = store.OpenInputStream(key);
  std::string out;
  for (;;) {
    auto block = stream->Read(1 << 16);
    assert(block.ok());
    if ((*block)->size() == 0) {
      break;
    }
    out.append(reinterpret_cast<const char*>((*block)->data()), static_cast<std::size_t>((*block)->size()));
  }
  return out;
}

void TestWriteListAndRead() {
  TempDir dir("object_store_rw");
  auto    store = LocalStore(dir.path());

  store->Write("raw/flights_2024_02.csv", "b");
  store->Write("raw/flights_2024_01.csv", "a");
  store->Write("raw/airports.dat", "x");
  store->Write("raw/nested/deep.csv", "n");
  store->Write("weather/KATL.csv", "w");

  const auto raw = store->List("raw/");
  assert(raw.size() == 3);
  assert(raw[0] == "raw/airports.dat");
  assert(raw[1] == "raw/flights_2024_01.csv");
  assert(raw[2] == "raw/flights_2024_02.csv");

  const auto filtered = store->List("raw/flights_");
  assert(filtered.size() == 2);
  assert(filtered[0] == "raw/flights_2024_01.csv");

  assert(store->List("missing/").empty());

  assert(store->Exists("raw/flights_2024_01.csv"));
  assert(!store->Exists("raw/flights_2024_03.csv"));
  assert(!store->Exists("raw/nested"));

  assert(ReadAll(*store, "raw/flights_2024_02.csv") == "b");
}

void TestUploadCopiesLocalFile() {
  TempDir dir("object_store_upload");
  auto    store = LocalStore(dir.path() / "bucket");

  std::string payload(5 * 1024 * 1024 + 17, 'q');
  payload[0]                  = 'F';
  payload[payload.size() - 1] = 'L';
  WriteFile(dir.path() / "local" / "big.csv", payload);

  store->Upload(dir.path() / "local" / "big.csv", "raw/big.csv");
  assert(store->Exists("raw/big.csv"));
  assert(ReadAll(*store, "raw/big.csv") == payload);
}

void TestUploadOfMissingFileIsStorageError() {
  TempDir dir("object_store_missing");
  auto    store = LocalStore(dir.path());

  bool threw = false;
  try {
    store->Upload(dir.path() / "does_not_exist.csv", "raw/x.csv");
  } catch (const flightline::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestKeysMayNotEscapeTheRoot() {
  TempDir dir("object_store_keys");
  auto    store = LocalStore(dir.path());

  for (const std::string key : {"", "/etc/passwd", "raw/../../escape.csv"}) {
    bool threw = false;
    try {
      (void)store->Exists(key);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestFromConfigResolvesLocalRoot() {
  TempDir dir("object_store_config");

  flightline::runtime::config::StorageConfig config;
  config.set_root_uri(dir.path().string());

  auto store = flightline::storage::ArrowObjectStore::FromConfig(config);
  store->Write("raw/a.csv", "1");
  assert(std::filesystem::exists(dir.path() / "raw" / "a.csv"));
}

} // namespace

int main() {
  TestWriteListAndRead();
  TestUploadCopiesLocalFile();
  TestUploadOfMissingFileIsStorageError();
  TestKeysMayNotEscapeTheRoot();
  TestFromConfigResolvesLocalRoot();

  std::cout << "flightline_unit_object_store: pass\n";
  return 0;
}
