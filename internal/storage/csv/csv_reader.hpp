#pragma once

#include <arrow/array.h>
#include <arrow/csv/api.h>
#include <arrow/record_batch.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/object_store.hpp"

namespace flightline::storage::csv {

using CsvRow = std::vector<std::optional<std::string>>;

/*
  A run of consecutive data rows. Values follow CsvReadSpec::columns
  order; null values (per CsvReadSpec::null_values) are nullopt.
*/
struct CsvChunk {
  uint64_t            first_row = 0; // 0-based data row index of rows[0]
  std::vector<CsvRow> rows;
};

struct CsvReadSpec {
  // Columns to project, in output order. Columns absent from the file read as null.
  std::vector<std::string> columns;

  // Column names for headerless files; empty means the first line is the header.
  std::vector<std::string> header_names;

  std::vector<std::string> null_values{""};

  std::size_t chunk_rows = 50000;
};

// Column names from the header line. Throws SchemaError for an empty object.
std::vector<std::string> ReadHeader(ObjectStore& store, const std::string& key);

/*
  ChunkedCsvReader

  Streams an object through arrow::csv::StreamingReader and regroups
  Arrow's record batches into chunks of exactly chunk_rows rows (the
  last one shorter). All projected columns are read as utf8 so the
  caller owns coercion. Memory is bounded by one Arrow block plus one
  chunk.
*/
class ChunkedCsvReader {
 public:
  ChunkedCsvReader(ObjectStore& store, const std::string& key, CsvReadSpec spec);

  // Fill the next chunk. Returns false once the file is exhausted.
  bool Next(CsvChunk& chunk);

  uint64_t RowsRead() const {
    return next_row_;
  }

 private:
  bool FillBatch();

  std::string                                       key_;
  CsvReadSpec                                       spec_;
  std::shared_ptr<arrow::csv::StreamingReader>      reader_;
  std::shared_ptr<arrow::RecordBatch>               batch_;
  std::vector<std::shared_ptr<arrow::StringArray>>  columns_;
  int64_t                                           batch_offset_ = 0;
  uint64_t                                          next_row_     = 0;
  bool                                              done_         = false;
};

} // namespace flightline::storage::csv
