#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "streamgate/v1/types.pb.h"

namespace streamgate::core {

/*
  TokenStore owns every piece of mutable state streamgate keeps: token ->
  reference records with expiry, recency history, sections, credit
  balances, payment requests, premium users and engagement counters.

  Expected outcomes (missing keys, insufficient balance, finalized
  payments, name collisions) come back as ErrorKind in the result structs.
  Caller mistakes throw util::InvalidArgument; backend failures throw
  std::runtime_error.

  Every operation runs in its own repository transaction, so the store
  behaves the same over the in-process and the shared backends.
*/

struct TokenStoreOptions {
  uint64_t history_limit = 200;

  // Applied when Put/Ingest carry no TTL. Zero or negative never expires.
  std::chrono::seconds default_ttl{86400};

  std::chrono::seconds pending_submission_ttl{1800};
  int64_t              default_price_per_credit_minor = 35;

  util::ClockFn clock = util::Now;
};

struct IngestResult {
  std::string                    token;
  std::string                    premium_token; // empty unless requested
  streamgate::v1::MediaReference reference;
};

struct SectionOutcome {
  std::optional<util::ErrorKind> error;
  streamgate::v1::Section        section;
};

struct ChargeOutcome {
  bool    ok      = false;
  int64_t balance = 0;
};

struct PaymentOutcome {
  std::optional<util::ErrorKind> error;
  streamgate::v1::PaymentRequest request;

  // Balance of the request owner after the operation.
  int64_t balance = 0;
};

class TokenStore {
 public:
  TokenStore(std::shared_ptr<db::Repository> repository, TokenStoreOptions options);

  // ------------------------------------------------------------------
  // References
  // ------------------------------------------------------------------

  // Overwrites the token's reference, then records it in the history and,
  // when the reference names one, in its section.
  void Put(const std::string& token, const streamgate::v1::MediaReference& reference, std::optional<std::chrono::seconds> ttl);

  // Mints a normal-tier token (and optionally a premium alias) for the
  // reference. The current section is stamped on references without one.
  IngestResult Ingest(streamgate::v1::MediaReference reference, std::optional<std::chrono::seconds> ttl, bool with_premium_alias);

  // nullopt when absent or expired more than `grace` ago.
  std::optional<streamgate::v1::MediaReference> Get(const std::string& token, std::chrono::seconds grace = std::chrono::seconds(0));

  // Newest first; tokens whose reference expired are skipped.
  std::vector<std::string> ListRecent(uint64_t limit);

  // Physically removes expired references. Returns the number removed.
  uint64_t PurgeExpired();

  // ------------------------------------------------------------------
  // Sections
  // ------------------------------------------------------------------

  // kNameConflict when the normalized name or its slug is taken.
  SectionOutcome CreateSection(const std::string& name);

  // Accepts a section name or slug.
  bool DeleteSection(const std::string& name_or_slug);
  bool SectionExists(const std::string& name_or_slug);

  std::optional<streamgate::v1::Section> GetSectionById(const std::string& id);
  std::optional<streamgate::v1::Section> GetSectionByName(const std::string& name);
  std::vector<streamgate::v1::Section>   ListSections();

  // nullopt when the section does not exist.
  std::optional<std::vector<std::string>> ListSection(const std::string& name_or_slug, uint64_t limit);

  SectionOutcome                         SetCurrentSection(const std::string& name_or_slug);
  void                                   ClearCurrentSection();
  std::optional<streamgate::v1::Section> CurrentSection();

  // ------------------------------------------------------------------
  // Credits
  // ------------------------------------------------------------------

  int64_t GetCredits(int64_t user_id);
  int64_t AddCredits(int64_t user_id, int64_t amount);

  // Atomic check-and-decrement. amount <= 0 is a successful no-op.
  ChargeOutcome ChargeCredits(int64_t user_id, int64_t amount);

  int64_t RefundCredits(int64_t user_id, int64_t amount);

  std::vector<streamgate::v1::CreditBalance> ListCreditBalances(uint64_t limit);

  int64_t GetPricePerCredit();
  int64_t SetPricePerCredit(int64_t price_minor);

  static int64_t CreditsForAmount(int64_t amount_minor, int64_t price_per_credit_minor);

  // Account that payers send money to, e.g. "shop.name@bank". nullopt until set.
  std::optional<std::string> GetPayeeId();
  // nullopt or "" clears. Throws util::InvalidArgument on a malformed id.
  void SetPayeeId(const std::optional<std::string>& payee_id);

  // name@provider, name of [A-Za-z0-9._-] and provider of letters, both at least two long.
  static bool ValidPayeeId(const std::string& payee_id);

  // ------------------------------------------------------------------
  // Payment requests
  // ------------------------------------------------------------------

  // credits == 0 derives the credits from the pay plan.
  streamgate::v1::PaymentRequest CreatePaymentRequest(int64_t user_id, int64_t amount_minor, int64_t credits);

  // pending -> submitted, restricted to the owner.
  PaymentOutcome SubmitPayment(uint64_t request_id, int64_t user_id, const std::string& reference_note);

  // Admin transition. Approval grants the request's credits exactly once.
  PaymentOutcome SetPaymentStatus(uint64_t request_id, streamgate::v1::PaymentStatus status, const std::string& note, int64_t admin_id);

  std::optional<streamgate::v1::PaymentRequest>  GetPaymentRequest(uint64_t request_id);
  std::vector<streamgate::v1::PaymentRequest>    ListPaymentRequests(std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit);

  PaymentOutcome          SetPendingSubmission(int64_t user_id, uint64_t request_id);
  std::optional<uint64_t> PendingSubmission(int64_t user_id);

  // ------------------------------------------------------------------
  // Premium users
  // ------------------------------------------------------------------

  // nullopt period = lifetime.
  streamgate::v1::PremiumUser              AddPremiumUser(int64_t user_id, std::optional<uint32_t> period_days);
  bool                                     RemovePremiumUser(int64_t user_id);
  bool                                     IsPremium(int64_t user_id);
  std::vector<streamgate::v1::PremiumUser> ListPremiumUsers();

  // ------------------------------------------------------------------
  // Engagement
  // ------------------------------------------------------------------

  streamgate::v1::ViewCounts     IncrementView(const std::string& token, const std::optional<std::string>& viewer_fingerprint);
  streamgate::v1::ViewCounts     GetViews(const std::string& token);
  streamgate::v1::ReactionCounts SetReaction(const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction);
  streamgate::v1::ReactionCounts GetReactions(const std::string& token, int64_t user_id);

  const TokenStoreOptions& Options() const {
    return options_;
  }

 private:
  uint64_t NowMs() const;
  uint64_t ExpiryFor(std::optional<std::chrono::seconds> ttl) const;

  void PutLocked(db::Transaction& tx, const std::string& token, const streamgate::v1::MediaReference& reference, uint64_t expires_at_ms);

  std::optional<db::model::SectionRecord> FindSection(db::Transaction& tx, const std::string& name_or_slug);

  std::shared_ptr<db::Repository> repository_;
  TokenStoreOptions               options_;

  // Single writer (admin), many readers (ingestion). Not persisted.
  struct CurrentSectionRef {
    std::string id;
    std::string name;
  };
  mutable std::shared_mutex        current_section_mutex_;
  std::optional<CurrentSectionRef> current_section_;
};

} // namespace streamgate::core
