#include "date_dim.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flightline::dimension {

namespace {

constexpr std::array<const char*, 7> kDayNames = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};

constexpr std::array<const char*, 12> kMonthNames = {"January", "February", "March",     "April",   "May",      "June",
                                                     "July",    "August",   "September", "October", "November", "December"};

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '"')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '"')) s.remove_suffix(1);
  return s;
}

bool ParseInt(std::string_view s, int& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

const char* Season(unsigned month) {
  switch (month) {
    case 12:
    case 1:
    case 2: return "Winter";
    case 3:
    case 4:
    case 5: return "Spring";
    case 6:
    case 7:
    case 8: return "Summer";
    default: return "Fall";
  }
}

std::optional<std::chrono::year_month_day> MakeDate(int y, int m, int d) {
  if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
  std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                  std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;
  return ymd;
}

std::string Format(const std::chrono::year_month_day& ymd) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::optional<std::chrono::year_month_day> ParseIso(std::string_view s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
  int y = 0, m = 0, d = 0;
  if (!ParseInt(s.substr(0, 4), y) || !ParseInt(s.substr(5, 2), m) || !ParseInt(s.substr(8, 2), d)) return std::nullopt;
  return MakeDate(y, m, d);
}

std::optional<std::chrono::year_month_day> ParseUs(std::string_view s) {
  auto first = s.find('/');
  if (first == std::string_view::npos) return std::nullopt;
  auto second = s.find('/', first + 1);
  if (second == std::string_view::npos) return std::nullopt;

  int m = 0, d = 0, y = 0;
  if (!ParseInt(s.substr(0, first), m) || !ParseInt(s.substr(first + 1, second - first - 1), d) ||
      !ParseInt(s.substr(second + 1), y) || s.size() - second - 1 != 4) {
    return std::nullopt;
  }
  return MakeDate(y, m, d);
}

} // namespace

std::optional<std::string> NormalizeDate(std::string_view raw) {
  auto s = Trim(raw);

  // drop a trailing time of day
  if (auto space = s.find(' '); space != std::string_view::npos) {
    s = s.substr(0, space);
  }

  auto ymd = s.find('/') != std::string_view::npos ? ParseUs(s) : ParseIso(s);
  if (!ymd) return std::nullopt;
  return Format(*ymd);
}

db::model::DateRecord DeriveDate(const std::string& date_id) {
  auto ymd = ParseIso(date_id);
  if (!ymd) {
    throw std::invalid_argument("not a YYYY-MM-DD date: " + date_id);
  }

  const auto     month   = static_cast<unsigned>(ymd->month());
  const auto     weekday = std::chrono::weekday{std::chrono::sys_days{*ymd}};
  const unsigned dow     = weekday.iso_encoding() - 1; // Monday = 0

  db::model::DateRecord r;
  r.date_id      = date_id;
  r.year         = static_cast<int>(ymd->year());
  r.quarter      = static_cast<int>((month - 1) / 3 + 1);
  r.month        = static_cast<int>(month);
  r.day_of_month = static_cast<int>(static_cast<unsigned>(ymd->day()));
  r.day_of_week  = static_cast<int>(dow);
  r.day_name     = kDayNames[dow];
  r.month_name   = kMonthNames[month - 1];
  r.is_weekend   = dow >= 5;
  r.season       = Season(month);
  return r;
}

std::vector<db::model::DateRecord> DeriveDates(const std::set<std::string>& date_ids) {
  std::vector<db::model::DateRecord> out;
  out.reserve(date_ids.size());
  for (const auto& id : date_ids) {
    out.push_back(DeriveDate(id));
  }
  return out;
}

uint64_t EnsureDates(db::Repository& repo, const std::set<std::string>& date_ids) {
  if (date_ids.empty()) {
    return 0;
  }

  auto rows = DeriveDates(date_ids);
  auto tx   = repo.Begin();
  util::ThrowIfDbError(repo.InsertDates(*tx, rows), "insert date_dim");
  tx->Commit();
  return rows.size();
}

} // namespace flightline::dimension
