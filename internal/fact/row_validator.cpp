#include "row_validator.hpp"

#include "internal/dimension/date_dim.hpp"
#include "internal/fact/flight_row.hpp"
#include "internal/util/coerce.hpp"

namespace flightline::fact {

namespace {

std::string KeyText(const storage::csv::CsvRow& row, FactColumn column) {
  return util::ToText(row[column]).value_or("");
}

} // namespace

DimensionSnapshot DimensionSnapshot::Load(db::Repository& repo) {
  DimensionSnapshot snapshot;

  auto tx = repo.Begin();
  for (auto& code : repo.ListAirportCodes(*tx)) {
    snapshot.airports.insert(std::move(code));
  }
  for (auto& code : repo.ListCarrierCodes(*tx)) {
    snapshot.carriers.insert(std::move(code));
  }
  for (auto& date : repo.ListDates(*tx)) {
    snapshot.dates.insert(std::move(date));
  }
  tx->Commit();

  return snapshot;
}

std::string RowVerdict::Reason() const {
  std::string joined;
  for (const auto& reason : reasons) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += reason;
  }
  return joined;
}

RowVerdict ValidateRow(const storage::csv::CsvRow& row, const DimensionSnapshot& snapshot) {
  const auto date    = KeyText(row, kFlightDate);
  const auto carrier = KeyText(row, kReportingAirline);
  const auto origin  = KeyText(row, kOrigin);
  const auto dest    = KeyText(row, kDest);

  RowVerdict verdict;
  verdict.raw_data = date + "," + carrier + "," + origin + "," + dest;

  if (!snapshot.airports.contains(origin)) {
    verdict.reasons.push_back("Unknown origin airport: " + origin);
  }
  if (!snapshot.airports.contains(dest)) {
    verdict.reasons.push_back("Unknown dest airport: " + dest);
  }
  if (!snapshot.carriers.contains(carrier)) {
    verdict.reasons.push_back("Unknown carrier: " + carrier);
  }

  auto canonical = dimension::NormalizeDate(date);
  if (canonical && snapshot.dates.contains(*canonical)) {
    verdict.flight_date = std::move(*canonical);
  } else {
    verdict.reasons.push_back("Unknown date: " + date);
  }

  verdict.accepted = verdict.reasons.empty();
  return verdict;
}

} // namespace flightline::fact
