#pragma once

#include <cstdint>
#include <optional>

namespace streamgate::db::model {

struct CreditRecord {
  int64_t user_id = 0;
  int64_t balance = 0;
};

struct PremiumUserRecord {
  int64_t user_id = 0;

  // nullopt = lifetime
  std::optional<uint64_t> expires_at_ms;
};

} // namespace streamgate::db::model
