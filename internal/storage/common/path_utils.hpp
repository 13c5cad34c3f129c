#pragma once

#include <stdexcept>
#include <string>

namespace flightline::storage::common {

/*
  Object keys are '/'-separated and relative to the store root.
*/

inline void ValidateKey(const std::string& key) {
  if (key.empty()) {
    throw std::invalid_argument("object key must not be empty");
  }
  if (key.front() == '/') {
    throw std::invalid_argument("object key must be relative: " + key);
  }
  std::size_t start = 0;
  while (start <= key.size()) {
    auto end = key.find('/', start);
    if (end == std::string::npos) end = key.size();
    if (key.compare(start, end - start, "..") == 0) {
      throw std::invalid_argument("object key must not escape the root: " + key);
    }
    start = end + 1;
  }
}

// "raw/2024/flights.csv" -> "flights.csv"
inline std::string BaseName(const std::string& key) {
  auto pos = key.find_last_of('/');
  return pos == std::string::npos ? key : key.substr(pos + 1);
}

// "raw/2024/flights.csv" -> "raw/2024", "flights.csv" -> ""
inline std::string ParentKey(const std::string& key) {
  auto pos = key.find_last_of('/');
  return pos == std::string::npos ? std::string{} : key.substr(0, pos);
}

inline std::string JoinKey(const std::string& root, const std::string& key) {
  if (root.empty()) return key;
  if (key.empty()) return root;
  if (root.back() == '/') return root + key;
  return root + "/" + key;
}

} // namespace flightline::storage::common
