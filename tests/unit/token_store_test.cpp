#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/core/token_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace streamgate::v1;
using streamgate::core::TokenStore;
using streamgate::core::TokenStoreOptions;
using streamgate::util::ErrorKind;

struct ManualClock {
  std::shared_ptr<std::atomic<int64_t>> ms = std::make_shared<std::atomic<int64_t>>(1'700'000'000'000);

  streamgate::util::ClockFn Fn() const {
    auto state = ms;
    return [state] { return streamgate::util::FromUnixMillis(static_cast<uint64_t>(state->load())); };
  }

  void Advance(std::chrono::seconds s) {
    ms->fetch_add(std::chrono::duration_cast<std::chrono::milliseconds>(s).count());
  }
};

std::shared_ptr<TokenStore> MakeStore(ManualClock& clock, uint64_t history_limit = 200) {
  TokenStoreOptions options;
  options.history_limit = history_limit;
  options.clock         = clock.Fn();
  return std::make_shared<TokenStore>(std::make_shared<streamgate::db::memory::MemoryRepository>(), options);
}

MediaReference Video(int64_t message_id) {
  MediaReference ref;
  ref.mutable_primary_locator()->set_chat_id(-100);
  ref.mutable_primary_locator()->set_message_id(message_id);
  ref.set_file_name("clip.mp4");
  ref.set_mime_type("video/mp4");
  ref.set_size_bytes(1000);
  ref.set_media_kind(MEDIA_KIND_VIDEO);
  return ref;
}

void TestPutGetAndExpiry() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  store->Put("t1", Video(1), std::chrono::seconds(60));
  auto got = store->Get("t1");
  assert(got.has_value());
  assert(got->primary_locator().message_id() == 1);
  assert(got->created_at_ms() != 0);

  clock.Advance(std::chrono::seconds(59));
  assert(store->Get("t1").has_value());

  clock.Advance(std::chrono::seconds(2));
  // Past expiry but inside the grace window.
  assert(store->Get("t1", std::chrono::seconds(10)).has_value());
  assert(!store->Get("t1").has_value());
  assert(!store->Get("missing").has_value());
}

void TestNonPositiveTtlNeverExpires() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  store->Put("forever", Video(2), std::chrono::seconds(0));
  clock.Advance(std::chrono::hours(24 * 365));
  assert(store->Get("forever").has_value());
  assert(store->PurgeExpired() == 0);
}

void TestPutOverwritesAndMovesToFront() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  store->Put("a", Video(1), std::nullopt);
  store->Put("b", Video(2), std::nullopt);
  store->Put("a", Video(3), std::nullopt);

  auto recent = store->ListRecent(10);
  assert(recent.size() == 2);
  assert(recent[0] == "a");
  assert(recent[1] == "b");
  assert(store->Get("a")->primary_locator().message_id() == 3);
}

void TestHistoryIsCapped() {
  ManualClock clock;
  auto        store = MakeStore(clock, 3);

  for (int i = 0; i < 5; ++i) {
    store->Put("t" + std::to_string(i), Video(i + 1), std::nullopt);
  }
  auto recent = store->ListRecent(0);
  assert(recent.size() == 3);
  assert(recent[0] == "t4");
  assert(recent[2] == "t2");

  assert(store->ListRecent(1).size() == 1);
}

void TestRecentSkipsExpiredAndPurgeRemoves() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  store->Put("short", Video(1), std::chrono::seconds(5));
  store->Put("long", Video(2), std::chrono::seconds(500));
  clock.Advance(std::chrono::seconds(10));

  auto recent = store->ListRecent(10);
  assert(recent.size() == 1);
  assert(recent[0] == "long");

  clock.Advance(std::chrono::seconds(1000));
  assert(store->PurgeExpired() == 1);
  assert(store->ListRecent(10).empty());
}

void TestEmptyTokenIsRejected() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  bool threw = false;
  try {
    store->Put("", Video(1), std::nullopt);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestIngestMintsDistinctTokensAndPremiumAlias() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  auto plain = store->Ingest(Video(7), std::nullopt, false);
  assert(plain.token.size() == 43);
  assert(plain.premium_token.empty());
  assert(plain.reference.access_tier() == ACCESS_TIER_NORMAL);

  auto both = store->Ingest(Video(7), std::nullopt, true);
  assert(!both.premium_token.empty());
  assert(both.premium_token != both.token);
  assert(both.token != plain.token);

  auto premium = store->Get(both.premium_token);
  assert(premium.has_value());
  assert(premium->access_tier() == ACCESS_TIER_PREMIUM);
  assert(premium->primary_locator().message_id() == 7);
  assert(store->Get(both.token)->access_tier() == ACCESS_TIER_NORMAL);

  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    assert(seen.insert(store->Ingest(Video(8), std::nullopt, false).token).second);
  }
}

void TestIngestWithoutLocatorIsRejected() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  bool threw = false;
  try {
    (void)store->Ingest(MediaReference{}, std::nullopt, false);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestSectionsNormalizeAndConflict() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  auto created = store->CreateSection("  Weekend   Movies ");
  assert(!created.error);
  assert(created.section.name() == "weekend movies");
  assert(created.section.id() == "weekend-movies");

  auto clash = store->CreateSection("WEEKEND MOVIES");
  assert(clash.error == ErrorKind::kNameConflict);

  assert(store->SectionExists("weekend movies"));
  assert(store->SectionExists("weekend-movies"));
  assert(!store->SectionExists("weekday"));
  assert(store->ListSections().size() == 1);

  bool threw = false;
  try {
    (void)store->CreateSection("   ");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestCurrentSectionStampsIngest() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  assert(store->SetCurrentSection("news").error == ErrorKind::kNotFound);

  (void)store->CreateSection("News");
  auto set = store->SetCurrentSection("NEWS");
  assert(!set.error);
  assert(store->CurrentSection()->id() == "news");

  auto first  = store->Ingest(Video(1), std::nullopt, false);
  auto second = store->Ingest(Video(2), std::nullopt, false);
  assert(first.reference.section_id() == "news");
  assert(first.reference.section_name() == "news");

  auto members = store->ListSection("news", 10);
  assert(members.has_value());
  assert(members->size() == 2);
  assert((*members)[0] == second.token);
  assert(store->GetSectionById("news")->member_count() == 2);

  store->ClearCurrentSection();
  assert(!store->CurrentSection().has_value());
  auto third = store->Ingest(Video(3), std::nullopt, false);
  assert(!third.reference.has_section_id());

  assert(!store->ListSection("sports", 10).has_value());
}

void TestDeleteSectionClearsCurrent() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  (void)store->CreateSection("Music");
  (void)store->SetCurrentSection("music");
  assert(store->DeleteSection("Music"));
  assert(!store->CurrentSection().has_value());
  assert(!store->DeleteSection("music"));
  assert(!store->SectionExists("music"));
}

void TestCreditsChargeAndRefund() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  assert(store->GetCredits(42) == 0);
  assert(store->AddCredits(42, 5) == 5);

  auto ok = store->ChargeCredits(42, 3);
  assert(ok.ok);
  assert(ok.balance == 2);

  auto denied = store->ChargeCredits(42, 3);
  assert(!denied.ok);
  assert(denied.balance == 2);
  assert(store->GetCredits(42) == 2);

  auto free = store->ChargeCredits(42, 0);
  assert(free.ok);
  assert(free.balance == 2);

  assert(store->RefundCredits(42, 3) == 5);

  bool threw = false;
  try {
    (void)store->AddCredits(42, -1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentChargesNeverOverdraw() {
  ManualClock clock;
  auto        store = MakeStore(clock);
  (void)store->AddCredits(7, 50);

  std::atomic<int>         succeeded{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 20; ++i) {
        if (store->ChargeCredits(7, 1).ok) succeeded.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(succeeded.load() == 50);
  assert(store->GetCredits(7) == 0);
}

void TestPayPlan() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  assert(store->GetPricePerCredit() == 35);
  assert(TokenStore::CreditsForAmount(100, 35) == 2);
  assert(TokenStore::CreditsForAmount(34, 35) == 0);

  assert(store->SetPricePerCredit(10) == 10);
  assert(store->GetPricePerCredit() == 10);

  auto request = store->CreatePaymentRequest(9, 100, 0);
  assert(request.credits() == 10);
  assert(request.status() == PAYMENT_STATUS_PENDING);
}

void TestPayeeId() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  assert(!store->GetPayeeId().has_value());

  store->SetPayeeId(std::string("shop.name-1@okbank"));
  assert(store->GetPayeeId() == std::string("shop.name-1@okbank"));

  store->SetPayeeId(std::string("  other_shop@ybl  "));
  assert(store->GetPayeeId() == std::string("other_shop@ybl"));

  for (const char* bad : {"noatsign", "a@bank", "ab@b", "ab@bank1", "ab@@bank", "a b@bank", "ab@ba@nk", "@bank"}) {
    bool rejected = false;
    try {
      store->SetPayeeId(std::string(bad));
    } catch (const streamgate::util::InvalidArgument&) {
      rejected = true;
    }
    assert(rejected);
  }
  assert(store->GetPayeeId() == std::string("other_shop@ybl"));

  store->SetPayeeId(std::string(""));
  assert(!store->GetPayeeId().has_value());

  store->SetPayeeId(std::string("xy@ab"));
  store->SetPayeeId(std::nullopt);
  assert(!store->GetPayeeId().has_value());

  assert(TokenStore::ValidPayeeId("xy@ab"));
  assert(!TokenStore::ValidPayeeId(""));
}

void TestPaymentApproveGrantsOnce() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  auto request = store->CreatePaymentRequest(11, 700, 20);

  auto submitted = store->SubmitPayment(request.id(), 11, "  TXN-998877  ");
  assert(!submitted.error);
  assert(submitted.request.status() == PAYMENT_STATUS_SUBMITTED);
  assert(submitted.request.note() == "TXN-998877");

  auto approved = store->SetPaymentStatus(request.id(), PAYMENT_STATUS_APPROVED, "ok", 1);
  assert(!approved.error);
  assert(approved.balance == 20);
  assert(approved.request.handled_by() == 1);

  auto again = store->SetPaymentStatus(request.id(), PAYMENT_STATUS_APPROVED, "ok", 1);
  assert(again.error == ErrorKind::kAlreadyFinalized);
  assert(store->GetCredits(11) == 20);

  auto reject = store->SetPaymentStatus(request.id(), PAYMENT_STATUS_REJECTED, "late", 1);
  assert(reject.error == ErrorKind::kAlreadyFinalized);
  assert(store->GetPaymentRequest(request.id())->status() == PAYMENT_STATUS_APPROVED);
}

void TestConcurrentApprovalsGrantOnce() {
  ManualClock clock;
  auto        store   = MakeStore(clock);
  auto        request = store->CreatePaymentRequest(12, 350, 10);

  std::atomic<int>         applied{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      if (!store->SetPaymentStatus(request.id(), PAYMENT_STATUS_APPROVED, "", 2).error) applied.fetch_add(1);
    });
  }
  for (auto& thread : threads) thread.join();

  assert(applied.load() == 1);
  assert(store->GetCredits(12) == 10);
}

void TestSubmitPaymentChecks() {
  ManualClock clock;
  auto        store   = MakeStore(clock);
  auto        request = store->CreatePaymentRequest(13, 350, 0);

  assert(store->SubmitPayment(9999, 13, "TXN-000001").error == ErrorKind::kNotFound);
  assert(store->SubmitPayment(request.id(), 14, "TXN-000001").error == ErrorKind::kAccessDenied);

  bool threw = false;
  try {
    (void)store->SubmitPayment(request.id(), 13, " abc ");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  assert(!store->SubmitPayment(request.id(), 13, "TXN-000001").error);

  threw = false;
  try {
    (void)store->SubmitPayment(request.id(), 13, "TXN-000002");
  } catch (const streamgate::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(!store->SetPaymentStatus(request.id(), PAYMENT_STATUS_REJECTED, "no such transfer", 1).error);
  assert(store->GetCredits(13) == 0);
  assert(store->SubmitPayment(request.id(), 13, "TXN-000003").error == ErrorKind::kAlreadyFinalized);
}

void TestListPaymentRequestsFiltersByStatus() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  auto a = store->CreatePaymentRequest(1, 100, 1);
  auto b = store->CreatePaymentRequest(2, 100, 1);
  (void)store->SubmitPayment(b.id(), 2, "TXN-123456");

  assert(store->ListPaymentRequests(std::nullopt, 0).size() == 2);
  auto pending = store->ListPaymentRequests(PAYMENT_STATUS_PENDING, 0);
  assert(pending.size() == 1);
  assert(pending[0].id() == a.id());
  assert(store->ListPaymentRequests(PAYMENT_STATUS_SUBMITTED, 0)[0].id() == b.id());
}

void TestPendingSubmissionExpiresAndClears() {
  ManualClock clock;
  auto        store   = MakeStore(clock);
  auto        request = store->CreatePaymentRequest(21, 350, 0);

  assert(store->SetPendingSubmission(22, request.id()).error == ErrorKind::kAccessDenied);
  assert(!store->SetPendingSubmission(21, request.id()).error);
  assert(store->PendingSubmission(21) == request.id());

  (void)store->SubmitPayment(request.id(), 21, "TXN-555555");
  assert(!store->PendingSubmission(21).has_value());

  auto second = store->CreatePaymentRequest(21, 350, 0);
  (void)store->SetPendingSubmission(21, second.id());
  clock.Advance(std::chrono::seconds(1801));
  assert(!store->PendingSubmission(21).has_value());
}

void TestAdminStatusChangeClearsOnlyItsOwnPendingSubmission() {
  ManualClock clock;
  auto        store = MakeStore(clock);
  auto        first = store->CreatePaymentRequest(23, 350, 0);
  auto        other = store->CreatePaymentRequest(23, 350, 0);

  (void)store->SetPendingSubmission(23, other.id());
  assert(!store->SetPaymentStatus(first.id(), PAYMENT_STATUS_APPROVED, "", 1).error);
  assert(store->PendingSubmission(23) == other.id());

  // Admin may mark a pending request submitted without a reference from the user.
  auto moved = store->SetPaymentStatus(other.id(), PAYMENT_STATUS_SUBMITTED, "paid at counter", 1);
  assert(!moved.error);
  assert(moved.request.status() == PAYMENT_STATUS_SUBMITTED);
  assert(!store->PendingSubmission(23).has_value());
  assert(store->GetCredits(23) == 10);

  assert(!store->SetPaymentStatus(other.id(), PAYMENT_STATUS_APPROVED, "", 1).error);
  assert(store->GetCredits(23) == 20);
}

void TestPremiumUsers() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  assert(!store->IsPremium(5));
  (void)store->AddPremiumUser(5, std::nullopt);
  (void)store->AddPremiumUser(6, 1u);
  assert(store->IsPremium(5));
  assert(store->IsPremium(6));
  assert(store->ListPremiumUsers().size() == 2);

  clock.Advance(std::chrono::hours(25));
  assert(store->IsPremium(5));
  assert(!store->IsPremium(6));

  assert(store->RemovePremiumUser(5));
  assert(!store->RemovePremiumUser(5));
  assert(!store->IsPremium(5));
}

void TestEngagementCounters() {
  ManualClock clock;
  auto        store = MakeStore(clock);

  (void)store->IncrementView("tok", std::string("viewer-a"));
  (void)store->IncrementView("tok", std::string("viewer-a"));
  auto views = store->IncrementView("tok", std::nullopt);
  assert(views.total() == 3);
  assert(views.unique_viewers() == 1);

  const streamgate::v1::ViewCounts seen = store->GetViews("tok");
  assert(seen.total() == 3);
  assert(seen.unique_viewers() == 1);
  const streamgate::v1::ViewCounts untouched = store->GetViews("other");
  assert(untouched.total() == 0);

  (void)store->SetReaction("tok", 1, REACTION_LIKE);
  (void)store->SetReaction("tok", 2, REACTION_LIKE);
  auto flipped = store->SetReaction("tok", 1, REACTION_DISLIKE);
  assert(flipped.likes() == 1);
  assert(flipped.dislikes() == 1);
  assert(flipped.current() == REACTION_DISLIKE);

  auto cleared = store->SetReaction("tok", 2, REACTION_NONE);
  assert(cleared.likes() == 0);
  assert(cleared.current() == REACTION_NONE);
  const streamgate::v1::ReactionCounts mine = store->GetReactions("tok", 1);
  assert(mine.current() == REACTION_DISLIKE);
  assert(mine.dislikes() == 1);
}

} // namespace

int main() {
  TestPutGetAndExpiry();
  TestNonPositiveTtlNeverExpires();
  TestPutOverwritesAndMovesToFront();
  TestHistoryIsCapped();
  TestRecentSkipsExpiredAndPurgeRemoves();
  TestEmptyTokenIsRejected();
  TestIngestMintsDistinctTokensAndPremiumAlias();
  TestIngestWithoutLocatorIsRejected();
  TestSectionsNormalizeAndConflict();
  TestCurrentSectionStampsIngest();
  TestDeleteSectionClearsCurrent();
  TestCreditsChargeAndRefund();
  TestConcurrentChargesNeverOverdraw();
  TestPayPlan();
  TestPayeeId();
  TestPaymentApproveGrantsOnce();
  TestConcurrentApprovalsGrantOnce();
  TestSubmitPaymentChecks();
  TestListPaymentRequestsFiltersByStatus();
  TestPendingSubmissionExpiresAndClears();
  TestAdminStatusChangeClearsOnlyItsOwnPendingSubmission();
  TestPremiumUsers();
  TestEngagementCounters();

  std::cout << "streamgate_unit_token_store: pass\n";
  return 0;
}
