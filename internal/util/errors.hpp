#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace flightline::util {

/*
  Central error types.

  Structural errors abort the running stage and are retried by the
  orchestrator. Data-quality problems never surface as exceptions until
  the quality gate, which raises QualityGateFailure (not retried).
*/

class StructuralError : public std::runtime_error {
 public:
  explicit StructuralError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Source file lacks a required column or has an unreadable layout.
class SchemaError : public StructuralError {
 public:
  explicit SchemaError(const std::string& msg) : StructuralError(msg) {
  }
};

// Object storage could not be listed, read or written.
class StorageError : public StructuralError {
 public:
  explicit StorageError(const std::string& msg) : StructuralError(msg) {
  }
};

// Warehouse write rejected by the backend.
class RepositoryError : public StructuralError {
 public:
  RepositoryError(db::ErrorCode code, const std::string& msg) : StructuralError(msg), code_(code) {
  }

  db::ErrorCode Code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

class QualityGateFailure : public std::runtime_error {
 public:
  explicit QualityGateFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  throw RepositoryError(result.code, context + ": " + result.Describe());
}

} // namespace flightline::util
