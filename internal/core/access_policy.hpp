#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/token_store.hpp"
#include "internal/util/errors.hpp"
#include "streamgate/v1/types.pb.h"

namespace streamgate::core {

struct AccessDecision {
  std::optional<util::ErrorKind> error;

  bool    charged   = false;
  bool    play_only = false;
  int64_t balance   = 0;

  streamgate::v1::MediaReference reference;
};

/*
  Delivery gating by access tier.

    normal tier                  -> allowed, play only, no charge
    premium tier, premium user   -> allowed, no charge
    premium tier, everyone else  -> charged credit_cost credits, denied
                                    with kInsufficientBalance if unaffordable
*/
class AccessPolicy {
 public:
  AccessPolicy(std::shared_ptr<TokenStore> store, int64_t credit_cost);

  AccessDecision Authorize(const std::string& token, int64_t user_id);

  // Gives back one delivery's worth of credits after a failed delivery.
  int64_t Refund(int64_t user_id);

  int64_t CreditCost() const {
    return credit_cost_;
  }

 private:
  std::shared_ptr<TokenStore> store_;
  int64_t                     credit_cost_;
};

} // namespace streamgate::core
