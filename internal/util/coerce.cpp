#include "coerce.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string_view>

namespace flightline::util {

namespace {

std::string_view TrimView(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

} // namespace

std::optional<std::string> ToText(const std::optional<std::string>& value) {
  if (!value) return std::nullopt;
  auto trimmed = TrimView(*value);
  if (trimmed.empty()) return std::nullopt;
  return std::string(trimmed);
}

std::optional<double> ToDouble(const std::optional<std::string>& value) {
  auto text = ToText(value);
  if (!text) return std::nullopt;

  char*  end    = nullptr;
  double parsed = std::strtod(text->c_str(), &end);
  if (end != text->c_str() + text->size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<int64_t> ToInteger(const std::optional<std::string>& value) {
  auto parsed = ToDouble(value);
  if (!parsed) return std::nullopt;

  auto truncated = std::trunc(*parsed);
  if (truncated < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
      truncated >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<int64_t>(truncated);
}

bool ToFlag(const std::optional<std::string>& value) {
  return ToInteger(value).value_or(0) != 0;
}

} // namespace flightline::util
