#include "carrier_loader.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/storage/csv/csv_reader.hpp"
#include "internal/util/coerce.hpp"
#include "internal/util/errors.hpp"

namespace flightline::dimension {

namespace {

constexpr const char* kCarrierColumn = "Reporting_Airline";
constexpr const char* kDotIdColumn   = "DOT_ID_Reporting_Airline";

} // namespace

std::string CarrierName(const std::string& code) {
  static const std::unordered_map<std::string, std::string> kNames = {
      {"AA", "American Airlines"},  {"DL", "Delta Air Lines"},      {"UA", "United Airlines"},
      {"WN", "Southwest Airlines"}, {"B6", "JetBlue Airways"},      {"AS", "Alaska Airlines"},
      {"NK", "Spirit Airlines"},    {"F9", "Frontier Airlines"},    {"G4", "Allegiant Air"},
      {"HA", "Hawaiian Airlines"},  {"SY", "Sun Country Airlines"}, {"MX", "MexicanaLink"},
      {"OH", "PSA Airlines"},       {"OO", "SkyWest Airlines"},     {"YV", "Mesa Airlines"},
      {"YX", "Republic Airways"},   {"QX", "Horizon Air"},          {"MQ", "Envoy Air"},
      {"9E", "Endeavor Air"},       {"EV", "ExpressJet Airlines"},  {"PT", "Piedmont Airlines"},
      {"ZW", "Air Wisconsin"},      {"CP", "Compass Airlines"},     {"C5", "CommutAir"},
      {"G7", "GoJet Airlines"},     {"KS", "Penair"},
  };

  auto it = kNames.find(code);
  return it != kNames.end() ? it->second : "Carrier " + code;
}

CarrierLoader::CarrierLoader(std::shared_ptr<db::Repository> repo, std::shared_ptr<storage::ObjectStore> store,
                             std::shared_ptr<ledger::Ledger> ledger, std::size_t chunk_rows)
    : repo_(std::move(repo)), store_(std::move(store)), ledger_(std::move(ledger)), chunk_rows_(chunk_rows) {
}

std::map<std::string, std::optional<int64_t>> CarrierLoader::CollectCarriers() {
  std::map<std::string, std::optional<int64_t>> carriers;

  for (const auto& key : ledger_->PendingFiles(ledger::kFlightsSource)) {
    const auto header = storage::csv::ReadHeader(*store_, key);
    if (std::find(header.begin(), header.end(), kCarrierColumn) == header.end()) {
      throw util::SchemaError(key + " lacks column " + kCarrierColumn);
    }

    storage::csv::CsvReadSpec spec;
    spec.columns    = {kCarrierColumn, kDotIdColumn};
    spec.chunk_rows = chunk_rows_;

    storage::csv::ChunkedCsvReader reader(*store_, key, spec);
    storage::csv::CsvChunk         chunk;
    while (reader.Next(chunk)) {
      for (const auto& row : chunk.rows) {
        auto code = util::ToText(row[0]);
        if (!code) {
          continue;
        }
        carriers.try_emplace(*code, util::ToInteger(row[1]));
      }
    }

    FLIGHTLINE_LOG_DEBUG("carriers scanned", {observability::StringField("file", key),
                                              observability::IntField("distinct_so_far", static_cast<int64_t>(carriers.size()))});
  }
  return carriers;
}

uint64_t CarrierLoader::Run() {
  observability::SpanScope span("dimension.carriers");

  const auto carriers = CollectCarriers();
  if (carriers.empty()) {
    FLIGHTLINE_LOG_INFO("no pending fact files; carriers unchanged");
    return 0;
  }

  std::vector<db::model::CarrierRecord> records;
  records.reserve(carriers.size());
  for (const auto& [code, dot_id] : carriers) {
    records.push_back({code, CarrierName(code), dot_id});
  }

  auto tx = repo_->Begin();
  util::ThrowIfDbError(repo_->InsertCarriers(*tx, records), "insert carriers");
  tx->Commit();

  span.SetAttribute("carriers", static_cast<int64_t>(records.size()));
  FLIGHTLINE_LOG_INFO("carriers loaded", {observability::IntField("carriers", static_cast<int64_t>(records.size()))});
  return records.size();
}

} // namespace flightline::dimension
