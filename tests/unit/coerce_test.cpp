#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "internal/fact/flight_row.hpp"
#include "internal/util/coerce.hpp"

namespace {

using flightline::storage::csv::CsvRow;
using flightline::util::ToDouble;
using flightline::util::ToFlag;
using flightline::util::ToInteger;
using flightline::util::ToText;

void TestTextIsTrimmedAndEmptyIsNull() {
  assert(ToText(std::string("  ATL ")) == std::optional<std::string>("ATL"));
  assert(!ToText(std::string("   ")));
  assert(!ToText(std::string("")));
  assert(!ToText(std::nullopt));
}

void TestNumericsBecomeNullWhenUnparsable() {
  assert(ToDouble(std::string("-12.50")) == std::optional<double>(-12.5));
  assert(ToDouble(std::string(" 7 ")) == std::optional<double>(7.0));
  assert(!ToDouble(std::string("12abc")));
  assert(!ToDouble(std::string("nan")));
  assert(!ToDouble(std::string("inf")));
  assert(!ToDouble(std::nullopt));
}

void TestIntegersGoThroughFloat() {
  assert(ToInteger(std::string("123.0")) == std::optional<int64_t>(123));
  assert(ToInteger(std::string("123.9")) == std::optional<int64_t>(123));
  assert(ToInteger(std::string("-4.7")) == std::optional<int64_t>(-4));
  assert(!ToInteger(std::string("twelve")));
  assert(!ToInteger(std::string("1e300")));
}

void TestFlags() {
  assert(ToFlag(std::string("1.00")));
  assert(ToFlag(std::string("1")));
  assert(!ToFlag(std::string("0.00")));
  assert(!ToFlag(std::string("yes")));
  assert(!ToFlag(std::nullopt));
}

void TestCoerceFlightRow() {
  using namespace flightline::fact;

  CsvRow row(kFactColumnCount);
  row[kFlightDate]        = "1/15/2024";
  row[kReportingAirline]  = " DL ";
  row[kTailNumber]        = "   ";
  row[kFlightNumber]      = "1234.0";
  row[kOrigin]            = "ATL";
  row[kOriginCityName]    = "Atlanta, GA";
  row[kDest]              = "ORD";
  row[kDepDelay]          = "-3.00";
  row[kDepDel15]          = "0.00";
  row[kArrDelay]          = "22.00";
  row[kArrDel15]          = "1.00";
  row[kCancelled]         = "0.00";
  row[kCancellationCode]  = std::nullopt;
  row[kDiverted]          = "bogus";
  row[kDistance]          = "606.00";
  row[kWeatherDelay]      = "n/a";
  row[kLateAircraftDelay] = "15";

  const auto r = CoerceFlightRow(row, "2024-01-15");
  assert(r.flight_date == "2024-01-15");
  assert(r.carrier_code == "DL");
  assert(!r.tail_number);
  assert(r.flight_number == std::optional<int64_t>(1234));
  assert(r.origin_airport == "ATL");
  assert(r.origin_city == std::optional<std::string>("Atlanta, GA"));
  assert(r.dest_airport == "ORD");
  assert(r.dep_delay == std::optional<double>(-3.0));
  assert(!r.dep_delay_15);
  assert(r.arr_delay == std::optional<double>(22.0));
  assert(r.arr_delay_15);
  assert(!r.cancelled);
  assert(!r.cancellation_code);
  assert(!r.diverted);
  assert(r.distance == std::optional<double>(606.0));
  assert(!r.weather_delay);
  assert(r.late_aircraft_delay == std::optional<double>(15.0));
  assert(!r.air_time);
}

void TestRequiredColumnsAreProjected() {
  using namespace flightline::fact;

  assert(FactColumns().size() == kFactColumnCount);
  assert(FactColumns()[kFlightNumber] == "Flight_Number_Reporting_Airline");
  assert(FactColumns()[kLateAircraftDelay] == "LateAircraftDelay");
  for (const auto& required : RequiredFactColumns()) {
    bool found = false;
    for (const auto& column : FactColumns()) {
      found = found || column == required;
    }
    assert(found);
  }
}

} // namespace

int main() {
  TestTextIsTrimmedAndEmptyIsNull();
  TestNumericsBecomeNullWhenUnparsable();
  TestIntegersGoThroughFloat();
  TestFlags();
  TestCoerceFlightRow();
  TestRequiredColumnsAreProjected();

  std::cout << "flightline_unit_coerce: pass\n";
  return 0;
}
