#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/core/access_policy.hpp"
#include "internal/core/token_store.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace streamgate::v1;
using streamgate::core::AccessPolicy;
using streamgate::core::TokenStore;
using streamgate::util::ErrorKind;

std::shared_ptr<TokenStore> MakeStore() {
  return std::make_shared<TokenStore>(std::make_shared<streamgate::db::memory::MemoryRepository>(), streamgate::core::TokenStoreOptions{});
}

void PutReference(TokenStore& store, const std::string& token, AccessTier tier) {
  MediaReference ref;
  ref.mutable_primary_locator()->set_chat_id(-1);
  ref.mutable_primary_locator()->set_message_id(10);
  ref.set_access_tier(tier);
  store.Put(token, ref, std::nullopt);
}

void TestUnknownTokenIsNotFound() {
  auto         store = MakeStore();
  AccessPolicy policy(store, 1);

  auto decision = policy.Authorize("missing", 5);
  assert(decision.error == ErrorKind::kNotFound);
  assert(!decision.charged);
}

void TestNormalTierIsPlayOnlyAndFree() {
  auto store = MakeStore();
  PutReference(*store, "normal", ACCESS_TIER_NORMAL);
  (void)store->AddCredits(5, 3);
  AccessPolicy policy(store, 1);

  auto decision = policy.Authorize("normal", 5);
  assert(!decision.error);
  assert(decision.play_only);
  assert(!decision.charged);
  assert(decision.balance == 3);
  assert(store->GetCredits(5) == 3);
}

void TestPremiumUserIsNotCharged() {
  auto store = MakeStore();
  PutReference(*store, "premium", ACCESS_TIER_PREMIUM);
  (void)store->AddPremiumUser(6, std::nullopt);
  AccessPolicy policy(store, 2);

  auto decision = policy.Authorize("premium", 6);
  assert(!decision.error);
  assert(!decision.play_only);
  assert(!decision.charged);
  assert(decision.reference.access_tier() == ACCESS_TIER_PREMIUM);
}

void TestPremiumTierChargesOthers() {
  auto store = MakeStore();
  PutReference(*store, "premium", ACCESS_TIER_PREMIUM);
  (void)store->AddCredits(7, 3);
  AccessPolicy policy(store, 2);

  auto first = policy.Authorize("premium", 7);
  assert(!first.error);
  assert(first.charged);
  assert(first.balance == 1);

  auto second = policy.Authorize("premium", 7);
  assert(second.error == ErrorKind::kInsufficientBalance);
  assert(!second.charged);
  assert(second.balance == 1);

  assert(policy.Refund(7) == 3);
}

void TestNegativeCostIsRejected() {
  bool threw = false;
  try {
    AccessPolicy policy(MakeStore(), -1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUnknownTokenIsNotFound();
  TestNormalTierIsPlayOnlyAndFree();
  TestPremiumUserIsNotCharged();
  TestPremiumTierChargesOthers();
  TestNegativeCostIsRejected();

  std::cout << "streamgate_unit_access_policy: pass\n";
  return 0;
}
