#pragma once

#include <cstdint>
#include <string>

namespace streamgate::db::model {

struct SectionRecord {
  std::string id;   // slug
  std::string name; // normalized
  uint64_t    created_at_ms = 0;

  // Filled on reads only.
  uint64_t member_count = 0;
};

} // namespace streamgate::db::model
