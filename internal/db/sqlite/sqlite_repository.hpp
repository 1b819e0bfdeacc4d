#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace streamgate::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

} // namespace streamgate::db::sqlite
