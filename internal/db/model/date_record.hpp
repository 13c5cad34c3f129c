#pragma once

#include <string>

namespace flightline::db::model {

/*
  Calendar attributes of one day. Pure function of date_id.
*/
struct DateRecord {
  std::string date_id; // YYYY-MM-DD

  int year         = 0;
  int quarter      = 0;
  int month        = 0;
  int day_of_month = 0;
  int day_of_week  = 0; // Monday = 0

  std::string day_name;
  std::string month_name;
  bool        is_weekend = false;
  std::string season;

  bool operator==(const DateRecord&) const = default;
};

} // namespace flightline::db::model
