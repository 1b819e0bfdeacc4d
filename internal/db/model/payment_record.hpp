#pragma once

#include <cstdint>
#include <string>

#include "streamgate/v1/types.pb.h"

namespace streamgate::db::model {

/*
  Persistent payment request row.

  id is assigned by the backend on insert (monotonic per database).
  status only moves along the table in internal/model/payment_state.hpp.
*/
struct PaymentRecord {
  uint64_t id      = 0;
  int64_t  user_id = 0;

  int64_t amount_minor = 0;
  int64_t credits      = 0;

  streamgate::v1::PaymentStatus status = streamgate::v1::PAYMENT_STATUS_PENDING;

  std::string note;
  int64_t     handled_by = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// Points a user at the request they are expected to submit a reference for.
struct PendingSubmissionRecord {
  int64_t  user_id       = 0;
  uint64_t request_id    = 0;
  uint64_t expires_at_ms = 0;
};

} // namespace streamgate::db::model
