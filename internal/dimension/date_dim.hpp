#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/date_record.hpp"

namespace flightline::dimension {

/*
  Canonical date_id ("YYYY-MM-DD") for a raw FlightDate value.

  Accepted forms:
    2024-01-15
    2024-01-15 00:00:00
    1/15/2024
    1/15/2024 12:00:00 AM

  Returns nullopt for anything else or for an impossible calendar day.
*/
std::optional<std::string> NormalizeDate(std::string_view raw);

// Calendar attributes of a canonical date_id. Throws std::invalid_argument.
db::model::DateRecord DeriveDate(const std::string& date_id);

std::vector<db::model::DateRecord> DeriveDates(const std::set<std::string>& date_ids);

/*
  Insert the derived rows for date_ids with conflict = do nothing, in
  one transaction. Returns the number of dates offered.
*/
uint64_t EnsureDates(db::Repository& repo, const std::set<std::string>& date_ids);

} // namespace flightline::dimension
