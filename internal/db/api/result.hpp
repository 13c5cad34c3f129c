#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace flightline::db {

// Driver failures (pqxx exceptions, sqlite rc values) mapped to one set
// of codes so loaders never see driver types.
enum class ErrorCode {
  OK = 0,
  Busy,
  ConstraintViolation,
  SerializationFailure,
  IOError,
  Corruption,
  InvalidArgument,
  InternalError
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InvalidArgument: return "invalid_argument";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

// Outcome of a warehouse write.
struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "constraint_violation: <message>"
  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out += ": " + message;
    }
    return out;
  }
};

} // namespace flightline::db
