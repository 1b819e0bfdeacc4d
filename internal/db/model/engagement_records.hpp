#pragma once

#include <cstdint>

#include "streamgate/v1/types.pb.h"

namespace streamgate::db::model {

struct ViewCountRecord {
  uint64_t total          = 0;
  uint64_t unique_viewers = 0;
};

struct ReactionCountRecord {
  uint64_t                 likes    = 0;
  uint64_t                 dislikes = 0;
  streamgate::v1::Reaction current  = streamgate::v1::REACTION_NONE;
};

} // namespace streamgate::db::model
