#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace streamgate::util {

/*
  Central error types.

  Exceptions are reserved for caller mistakes and backend failures and get
  translated to gRPC status codes at the transport edge. Expected outcomes
  (missing token, insufficient balance, finalized payment, ...) travel as
  ErrorKind inside typed result structs instead.
*/

enum class ErrorKind {
  kNotFound,
  kRangeNotSatisfiable,
  kInsufficientBalance,
  kAlreadyFinalized,
  kNameConflict,
  kOriginUnavailable,
  kOriginTruncated,
  kAccessDenied,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kRangeNotSatisfiable:
      return "range_not_satisfiable";
    case ErrorKind::kInsufficientBalance:
      return "insufficient_balance";
    case ErrorKind::kAlreadyFinalized:
      return "already_finalized";
    case ErrorKind::kNameConflict:
      return "name_conflict";
    case ErrorKind::kOriginUnavailable:
      return "origin_unavailable";
    case ErrorKind::kOriginTruncated:
      return "origin_truncated";
    case ErrorKind::kAccessDenied:
      return "access_denied";
  }
  return "unknown";
}

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by a MediaOrigin when the upstream is rate limited or unreachable.
class OriginUnavailable : public std::runtime_error {
 public:
  OriginUnavailable(const std::string& msg, std::optional<std::chrono::seconds> retry_after)
      : std::runtime_error(msg), retry_after_(retry_after) {
  }

  std::optional<std::chrono::seconds> retry_after() const {
    return retry_after_;
  }

 private:
  std::optional<std::chrono::seconds> retry_after_;
};

} // namespace streamgate::util
