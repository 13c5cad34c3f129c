#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flightline::db::model {

struct CarrierRecord {
  std::string            carrier_code;
  std::string            carrier_name;
  std::optional<int64_t> dot_id; // DOT reporting airline id
};

} // namespace flightline::db::model
