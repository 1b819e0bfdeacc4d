#include "access_policy.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace streamgate::core {

AccessPolicy::AccessPolicy(std::shared_ptr<TokenStore> store, int64_t credit_cost) : store_(std::move(store)), credit_cost_(credit_cost) {
  if (!store_) {
    throw std::invalid_argument("AccessPolicy: store is required");
  }
  if (credit_cost_ < 0) {
    throw std::invalid_argument("AccessPolicy: credit cost must not be negative");
  }
}

AccessDecision AccessPolicy::Authorize(const std::string& token, int64_t user_id) {
  AccessDecision decision;

  auto reference = store_->Get(token);
  if (!reference) {
    decision.error = util::ErrorKind::kNotFound;
    return decision;
  }
  decision.reference = *reference;

  if (reference->access_tier() != streamgate::v1::ACCESS_TIER_PREMIUM) {
    decision.play_only = true;
    decision.balance   = store_->GetCredits(user_id);
    return decision;
  }

  if (store_->IsPremium(user_id)) {
    decision.balance = store_->GetCredits(user_id);
    return decision;
  }

  const auto charge = store_->ChargeCredits(user_id, credit_cost_);
  decision.balance  = charge.balance;
  if (!charge.ok) {
    decision.error = util::ErrorKind::kInsufficientBalance;
    STREAMGATE_LOG_INFO("premium delivery denied", {observability::IntField("user_id", user_id), observability::IntField("balance", charge.balance)});
    return decision;
  }
  decision.charged = credit_cost_ > 0;
  return decision;
}

int64_t AccessPolicy::Refund(int64_t user_id) {
  return store_->RefundCredits(user_id, credit_cost_);
}

} // namespace streamgate::core
