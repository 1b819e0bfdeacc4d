#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/repository.hpp"

namespace streamgate::db::memory {

class MemoryTransaction;

/*
  Process-local repository. Expiry is checked against the stored expiry
  timestamp on every read; expired references are dropped lazily.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                                 UpsertReference(Transaction&, const model::ReferenceRecord&) override;
  std::optional<model::ReferenceRecord> GetReference(Transaction&, const std::string& token, uint64_t now_ms) override;
  Result                                 DeleteExpiredReferences(Transaction&, uint64_t now_ms, uint64_t& deleted) override;

  Result                   AppendHistory(Transaction&, const std::string& token, uint64_t cap) override;
  std::vector<std::string> ListHistory(Transaction&, uint64_t limit) override;

  Result                              InsertSection(Transaction&, const model::SectionRecord&) override;
  std::optional<model::SectionRecord> GetSectionById(Transaction&, const std::string& id) override;
  std::optional<model::SectionRecord> GetSectionByName(Transaction&, const std::string& name) override;
  std::vector<model::SectionRecord>   ListSections(Transaction&) override;
  Result                              DeleteSection(Transaction&, const std::string& id) override;
  Result                   AppendSectionMember(Transaction&, const std::string& section_id, const std::string& token, uint64_t cap) override;
  std::vector<std::string> ListSectionMembers(Transaction&, const std::string& section_id, uint64_t limit) override;

  Result                     PutSetting(Transaction&, const std::string& key, const std::string& value) override;
  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;

  int64_t                          GetCredits(Transaction&, int64_t user_id) override;
  Result                           AddCredits(Transaction&, int64_t user_id, int64_t amount, int64_t& balance) override;
  Result                           ChargeCredits(Transaction&, int64_t user_id, int64_t amount, int64_t& balance) override;
  std::vector<model::CreditRecord> ListCreditBalances(Transaction&, uint64_t limit) override;

  Result                              InsertPayment(Transaction&, model::PaymentRecord& record) override;
  std::optional<model::PaymentRecord> GetPayment(Transaction&, uint64_t id) override;
  Result CompareAndSetPayment(Transaction&, const model::PaymentRecord& updated, streamgate::v1::PaymentStatus expected) override;
  std::vector<model::PaymentRecord> ListPayments(Transaction&, std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit) override;

  Result                                        PutPendingSubmission(Transaction&, const model::PendingSubmissionRecord&) override;
  std::optional<model::PendingSubmissionRecord> GetPendingSubmission(Transaction&, int64_t user_id, uint64_t now_ms) override;
  Result                                        DeletePendingSubmission(Transaction&, int64_t user_id) override;

  Result IncrementView(Transaction&, const std::string& token, const std::optional<std::string>& viewer_fingerprint,
                       model::ViewCountRecord& counts) override;
  model::ViewCountRecord     GetViews(Transaction&, const std::string& token) override;
  Result                     SetReaction(Transaction&, const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction) override;
  model::ReactionCountRecord GetReactions(Transaction&, const std::string& token, int64_t user_id) override;

  Result                                  UpsertPremiumUser(Transaction&, const model::PremiumUserRecord&) override;
  Result                                  DeletePremiumUser(Transaction&, int64_t user_id) override;
  std::optional<model::PremiumUserRecord> GetPremiumUser(Transaction&, int64_t user_id) override;
  std::vector<model::PremiumUserRecord>   ListPremiumUsers(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ReferenceRecord> references;
    std::deque<std::string>                                 history; // newest first

    std::map<std::string, model::SectionRecord>               sections; // by id
    std::unordered_map<std::string, std::string>              section_name_to_id;
    std::unordered_map<std::string, std::deque<std::string>> section_members;

    std::unordered_map<std::string, std::string> settings;

    std::unordered_map<int64_t, int64_t> credits;

    std::map<uint64_t, model::PaymentRecord>                    payments;
    uint64_t                                                    next_payment_id = 1;
    std::unordered_map<int64_t, model::PendingSubmissionRecord> pending_submissions;

    std::unordered_map<std::string, uint64_t>                                          view_totals;
    std::unordered_map<std::string, std::unordered_set<std::string>>                   view_viewers;
    std::unordered_map<std::string, std::unordered_map<int64_t, streamgate::v1::Reaction>> reactions;

    std::map<int64_t, model::PremiumUserRecord> premium_users;
  };

  std::mutex mutex_;
  State      state_;
};

} // namespace streamgate::db::memory
