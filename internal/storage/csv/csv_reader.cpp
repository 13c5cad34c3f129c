#include "csv_reader.hpp"

#include <arrow/io/interfaces.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace flightline::storage::csv {

namespace {

std::shared_ptr<arrow::csv::StreamingReader> MakeReader(ObjectStore& store, const std::string& key,
                                                        const arrow::csv::ReadOptions&    read_options,
                                                        const arrow::csv::ConvertOptions& convert_options) {
  auto input  = store.OpenInputStream(key);
  auto reader = arrow::csv::StreamingReader::Make(arrow::io::default_io_context(), std::move(input), read_options,
                                                  arrow::csv::ParseOptions::Defaults(), convert_options);
  if (!reader.ok()) {
    throw util::SchemaError("cannot read csv " + key + ": " + reader.status().ToString());
  }
  return *reader;
}

} // namespace

std::vector<std::string> ReadHeader(ObjectStore& store, const std::string& key) {
  auto reader = MakeReader(store, key, arrow::csv::ReadOptions::Defaults(), arrow::csv::ConvertOptions::Defaults());
  return reader->schema()->field_names();
}

ChunkedCsvReader::ChunkedCsvReader(ObjectStore& store, const std::string& key, CsvReadSpec spec)
    : key_(key), spec_(std::move(spec)) {
  if (spec_.chunk_rows == 0) {
    spec_.chunk_rows = 1;
  }

  auto read_options = arrow::csv::ReadOptions::Defaults();
  if (!spec_.header_names.empty()) {
    read_options.column_names              = spec_.header_names;
    read_options.autogenerate_column_names = false;
  }

  auto convert_options                    = arrow::csv::ConvertOptions::Defaults();
  convert_options.include_columns         = spec_.columns;
  convert_options.include_missing_columns = true;
  convert_options.null_values             = spec_.null_values;
  convert_options.strings_can_be_null     = true;
  for (const auto& column : spec_.columns) {
    convert_options.column_types[column] = arrow::utf8();
  }

  reader_ = MakeReader(store, key_, read_options, convert_options);
}

bool ChunkedCsvReader::FillBatch() {
  if (done_) {
    return false;
  }

  std::shared_ptr<arrow::RecordBatch> batch;
  auto                                status = reader_->ReadNext(&batch);
  if (!status.ok()) {
    throw util::SchemaError("csv parse failed in " + key_ + " near row " + std::to_string(next_row_) + ": " +
                            status.ToString());
  }
  if (!batch) {
    done_ = true;
    return false;
  }

  columns_.clear();
  columns_.reserve(spec_.columns.size());
  for (const auto& name : spec_.columns) {
    auto column = batch->GetColumnByName(name);
    if (!column || column->type_id() != arrow::Type::STRING) {
      throw util::SchemaError("csv column " + name + " unreadable in " + key_);
    }
    columns_.push_back(std::static_pointer_cast<arrow::StringArray>(column));
  }

  batch_        = std::move(batch);
  batch_offset_ = 0;
  return true;
}

bool ChunkedCsvReader::Next(CsvChunk& chunk) {
  chunk.first_row = next_row_;
  chunk.rows.clear();

  while (chunk.rows.size() < spec_.chunk_rows) {
    if (!batch_ || batch_offset_ >= batch_->num_rows()) {
      if (!FillBatch()) {
        break;
      }
      continue;
    }

    const auto wanted = static_cast<int64_t>(spec_.chunk_rows - chunk.rows.size());
    const auto take   = std::min(wanted, batch_->num_rows() - batch_offset_);

    for (int64_t i = batch_offset_; i < batch_offset_ + take; ++i) {
      CsvRow row;
      row.reserve(columns_.size());
      for (const auto& column : columns_) {
        if (column->IsNull(i)) {
          row.emplace_back(std::nullopt);
        } else {
          row.emplace_back(column->GetString(i));
        }
      }
      chunk.rows.push_back(std::move(row));
    }
    batch_offset_ += take;
  }

  next_row_ += chunk.rows.size();
  return !chunk.rows.empty();
}

} // namespace flightline::storage::csv
