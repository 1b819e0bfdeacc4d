#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/engagement_records.hpp"
#include "internal/db/model/ledger_records.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/model/section_record.hpp"

namespace streamgate::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - ChargeCredits is a single conditional decrement; it never leaves a
    balance below zero
  - CompareAndSetPayment only applies when the stored status still equals
    the expected one
  - InsertSection fails with AlreadyExists on an id OR name collision

  Expiry: every read taking now_ms hides rows whose expiry is in the past.
  Physical removal happens in DeleteExpiredReferences (or lazily, for the
  memory backend).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // References
  // ---------------------------------------------------------------------

  virtual Result UpsertReference(Transaction&, const model::ReferenceRecord&) = 0;

  virtual std::optional<model::ReferenceRecord> GetReference(Transaction&, const std::string& token, uint64_t now_ms) = 0;

  virtual Result DeleteExpiredReferences(Transaction&, uint64_t now_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Recency history and sections
  // ---------------------------------------------------------------------

  // Moves token to the head of the history and keeps at most `cap` entries.
  virtual Result AppendHistory(Transaction&, const std::string& token, uint64_t cap) = 0;

  // Newest first.
  virtual std::vector<std::string> ListHistory(Transaction&, uint64_t limit) = 0;

  virtual Result InsertSection(Transaction&, const model::SectionRecord&) = 0;

  virtual std::optional<model::SectionRecord> GetSectionById(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SectionRecord> GetSectionByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::SectionRecord> ListSections(Transaction&) = 0;

  // Removes the section and its member list. NotFound when absent.
  virtual Result DeleteSection(Transaction&, const std::string& id) = 0;

  virtual Result AppendSectionMember(Transaction&, const std::string& section_id, const std::string& token, uint64_t cap) = 0;

  // Newest first.
  virtual std::vector<std::string> ListSectionMembers(Transaction&, const std::string& section_id, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual Result PutSetting(Transaction&, const std::string& key, const std::string& value) = 0;

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Credits
  // ---------------------------------------------------------------------

  // Absent users have balance 0.
  virtual int64_t GetCredits(Transaction&, int64_t user_id) = 0;

  virtual Result AddCredits(Transaction&, int64_t user_id, int64_t amount, int64_t& balance) = 0;

  // Conflict (balance untouched, set to the current value) when the balance
  // cannot cover `amount`.
  virtual Result ChargeCredits(Transaction&, int64_t user_id, int64_t amount, int64_t& balance) = 0;

  // Ordered by balance descending, then user id.
  virtual std::vector<model::CreditRecord> ListCreditBalances(Transaction&, uint64_t limit) = 0;

  // ---------------------------------------------------------------------
  // Payment requests
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertPayment(Transaction&, model::PaymentRecord& record) = 0;

  virtual std::optional<model::PaymentRecord> GetPayment(Transaction&, uint64_t id) = 0;

  // NotFound when the row is missing, Conflict when its status moved on.
  virtual Result CompareAndSetPayment(Transaction&, const model::PaymentRecord& updated, streamgate::v1::PaymentStatus expected) = 0;

  // Newest first.
  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&, std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit) = 0;

  virtual Result PutPendingSubmission(Transaction&, const model::PendingSubmissionRecord&) = 0;

  virtual std::optional<model::PendingSubmissionRecord> GetPendingSubmission(Transaction&, int64_t user_id, uint64_t now_ms) = 0;

  virtual Result DeletePendingSubmission(Transaction&, int64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Engagement
  // ---------------------------------------------------------------------

  virtual Result IncrementView(Transaction&, const std::string& token, const std::optional<std::string>& viewer_fingerprint,
                               model::ViewCountRecord& counts) = 0;

  virtual model::ViewCountRecord GetViews(Transaction&, const std::string& token) = 0;

  // REACTION_NONE clears the user's choice.
  virtual Result SetReaction(Transaction&, const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction) = 0;

  virtual model::ReactionCountRecord GetReactions(Transaction&, const std::string& token, int64_t user_id) = 0;

  // ---------------------------------------------------------------------
  // Premium users
  // ---------------------------------------------------------------------

  virtual Result UpsertPremiumUser(Transaction&, const model::PremiumUserRecord&) = 0;

  // NotFound when absent.
  virtual Result DeletePremiumUser(Transaction&, int64_t user_id) = 0;

  virtual std::optional<model::PremiumUserRecord> GetPremiumUser(Transaction&, int64_t user_id) = 0;

  virtual std::vector<model::PremiumUserRecord> ListPremiumUsers(Transaction&) = 0;
};

} // namespace streamgate::db
