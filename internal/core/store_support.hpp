#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/section_record.hpp"
#include "internal/util/errors.hpp"
#include "streamgate/v1/types.pb.h"

namespace streamgate::core::detail {

inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

inline streamgate::v1::Section ToProto(const db::model::SectionRecord& record) {
  streamgate::v1::Section section;
  section.set_id(record.id);
  section.set_name(record.name);
  section.set_member_count(record.member_count);
  section.set_created_at_ms(record.created_at_ms);
  return section;
}

inline streamgate::v1::PaymentRequest ToProto(const db::model::PaymentRecord& record) {
  streamgate::v1::PaymentRequest request;
  request.set_id(record.id);
  request.set_user_id(record.user_id);
  request.set_amount_minor(record.amount_minor);
  request.set_credits(record.credits);
  request.set_status(record.status);
  request.set_note(record.note);
  request.set_handled_by(record.handled_by);
  request.set_created_at_ms(record.created_at_ms);
  request.set_updated_at_ms(record.updated_at_ms);
  return request;
}

} // namespace streamgate::core::detail
