#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flightline::util {

/*
  Source-value coercion. Unparsable input becomes null, never an error.
*/

// trimmed; empty -> nullopt
std::optional<std::string> ToText(const std::optional<std::string>& value);

// finite decimal; anything else -> nullopt
std::optional<double> ToDouble(const std::optional<std::string>& value);

// parsed as decimal then truncated ("123.0" -> 123)
std::optional<int64_t> ToInteger(const std::optional<std::string>& value);

// nonzero after truncation; unparsable -> false
bool ToFlag(const std::optional<std::string>& value);

} // namespace flightline::util
