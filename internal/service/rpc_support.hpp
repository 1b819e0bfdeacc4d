#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "streamgate/v1/types.pb.h"

namespace streamgate::service {

// Runs one RPC body, logging failures (with latency) before rethrowing them
// to the transport adapter.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    STREAMGATE_LOG_ERROR("RPC failed", {streamgate::observability::StringField("route", route), streamgate::observability::StringField("error", ex.what()),
                                        streamgate::observability::IntField("elapsed_ms", elapsed_ms)});
    throw;
  }
}

inline streamgate::v1::Outcome ToOutcome(const std::optional<util::ErrorKind>& error) {
  if (!error) {
    return streamgate::v1::OUTCOME_OK;
  }
  switch (*error) {
    case util::ErrorKind::kNotFound:
      return streamgate::v1::OUTCOME_NOT_FOUND;
    case util::ErrorKind::kInsufficientBalance:
      return streamgate::v1::OUTCOME_INSUFFICIENT_BALANCE;
    case util::ErrorKind::kAlreadyFinalized:
      return streamgate::v1::OUTCOME_ALREADY_FINALIZED;
    case util::ErrorKind::kNameConflict:
      return streamgate::v1::OUTCOME_NAME_CONFLICT;
    case util::ErrorKind::kAccessDenied:
      return streamgate::v1::OUTCOME_ACCESS_DENIED;
    default:
      throw std::runtime_error("no RPC outcome for " + std::string(util::ToString(*error)));
  }
}

} // namespace streamgate::service
