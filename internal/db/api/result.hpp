#pragma once

#include <string>
#include <utility>

namespace streamgate::db {

/*
  Portable result of a repository write.

  Backends translate sqlite return codes and pqxx exceptions into these
  codes; nothing above internal/db sees a driver error type.

  Conflict is reserved for conditional writes whose predicate did not hold
  (insufficient balance, payment status changed underneath a CAS).
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool Is(ErrorCode c) const {
    return code == c;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace streamgate::db
