#pragma once

#include <cstdint>
#include <string>

#include "streamgate/v1/types.pb.h"

namespace streamgate::db::model {

/*
  One token -> media reference row.

  The reference itself is immutable once written; Put on an existing token
  overwrites the whole row.
*/
struct ReferenceRecord {
  std::string token;

  streamgate::v1::MediaReference reference;

  // Absolute expiry (0 = never expires)
  uint64_t expires_at_ms = 0;
};

} // namespace streamgate::db::model
