#pragma once

#include "streamgate/v1/types.pb.h"

namespace streamgate::model {

using streamgate::v1::PaymentStatus;

/*
  Payment request state machine.

    pending ──► submitted
       │            │
       └─────┬──────┘
             ▼
   approved | rejected | cancelled   (terminal)
*/

constexpr bool IsTerminal(PaymentStatus status) {
  return status == streamgate::v1::PAYMENT_STATUS_APPROVED || status == streamgate::v1::PAYMENT_STATUS_REJECTED ||
         status == streamgate::v1::PAYMENT_STATUS_CANCELLED;
}

constexpr bool CanTransition(PaymentStatus from, PaymentStatus to) {
  switch (from) {
    case streamgate::v1::PAYMENT_STATUS_PENDING:
      return to == streamgate::v1::PAYMENT_STATUS_SUBMITTED || IsTerminal(to);
    case streamgate::v1::PAYMENT_STATUS_SUBMITTED:
      return IsTerminal(to);
    default:
      return false;
  }
}

static_assert(CanTransition(streamgate::v1::PAYMENT_STATUS_PENDING, streamgate::v1::PAYMENT_STATUS_SUBMITTED));
static_assert(!CanTransition(streamgate::v1::PAYMENT_STATUS_SUBMITTED, streamgate::v1::PAYMENT_STATUS_SUBMITTED));
static_assert(!CanTransition(streamgate::v1::PAYMENT_STATUS_APPROVED, streamgate::v1::PAYMENT_STATUS_APPROVED));
static_assert(!CanTransition(streamgate::v1::PAYMENT_STATUS_APPROVED, streamgate::v1::PAYMENT_STATUS_REJECTED));

} // namespace streamgate::model
