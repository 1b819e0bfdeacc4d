#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace streamgate::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// Journal the current value of map[key] (or its absence) before a write.
template <typename Map>
void Remember(MemoryTransaction& tx, Map& map, const typename Map::key_type& key) {
  auto it = map.find(key);
  if (it == map.end()) {
    tx.OnRollback([&map, key] { map.erase(key); });
  } else {
    tx.OnRollback([&map, key, prior = it->second] { map[key] = prior; });
  }
}

// Journal a whole value (small containers, counters).
template <typename T>
void RememberValue(MemoryTransaction& tx, T& value) {
  tx.OnRollback([&value, prior = value] { value = prior; });
}

bool Expired(const model::ReferenceRecord& record, uint64_t now_ms) {
  return record.expires_at_ms != 0 && record.expires_at_ms <= now_ms;
}

void PushFrontCapped(std::deque<std::string>& list, const std::string& token, uint64_t cap) {
  list.erase(std::remove(list.begin(), list.end(), token), list.end());
  list.push_front(token);
  while (cap > 0 && list.size() > cap) {
    list.pop_back();
  }
}

std::vector<std::string> Head(const std::deque<std::string>& list, uint64_t limit) {
  const auto n = std::min<uint64_t>(limit, list.size());
  return {list.begin(), list.begin() + static_cast<std::ptrdiff_t>(n)};
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

Result MemoryRepository::UpsertReference(Transaction& t, const model::ReferenceRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  Remember(tx, s.references, r.token);
  s.references[r.token] = r;
  return Result::Ok();
}

std::optional<model::ReferenceRecord> MemoryRepository::GetReference(Transaction& t, const std::string& token, uint64_t now_ms) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  auto  it = s.references.find(token);
  if (it == s.references.end()) return std::nullopt;
  if (Expired(it->second, now_ms)) {
    Remember(tx, s.references, token);
    s.references.erase(token);
    return std::nullopt;
  }
  return it->second;
}

Result MemoryRepository::DeleteExpiredReferences(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  deleted  = 0;

  std::vector<std::string> expired;
  for (const auto& [token, record] : s.references) {
    if (Expired(record, now_ms)) expired.push_back(token);
  }
  for (const auto& token : expired) {
    Remember(tx, s.references, token);
    s.references.erase(token);
    ++deleted;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// History / sections
// ------------------------------------------------------------------

Result MemoryRepository::AppendHistory(Transaction& t, const std::string& token, uint64_t cap) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  RememberValue(tx, s.history);
  PushFrontCapped(s.history, token, cap);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListHistory(Transaction& t, uint64_t limit) {
  return Head(TX(t).Data().history, limit);
}

Result MemoryRepository::InsertSection(Transaction& t, const model::SectionRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  if (s.sections.contains(r.id) || s.section_name_to_id.contains(r.name)) {
    return Result::Err(ErrorCode::AlreadyExists, "section '" + r.name + "' already exists");
  }

  Remember(tx, s.sections, r.id);
  Remember(tx, s.section_name_to_id, r.name);
  s.sections[r.id]               = r;
  s.sections[r.id].member_count  = 0;
  s.section_name_to_id[r.name]   = r.id;
  return Result::Ok();
}

std::optional<model::SectionRecord> MemoryRepository::GetSectionById(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Data();
  auto  it = s.sections.find(id);
  if (it == s.sections.end()) return std::nullopt;

  auto record          = it->second;
  auto members         = s.section_members.find(id);
  record.member_count  = members == s.section_members.end() ? 0 : members->second.size();
  return record;
}

std::optional<model::SectionRecord> MemoryRepository::GetSectionByName(Transaction& t, const std::string& name) {
  auto& s  = TX(t).Data();
  auto  it = s.section_name_to_id.find(name);
  if (it == s.section_name_to_id.end()) return std::nullopt;
  return GetSectionById(t, it->second);
}

std::vector<model::SectionRecord> MemoryRepository::ListSections(Transaction& t) {
  std::vector<model::SectionRecord> out;
  for (const auto& [id, _] : TX(t).Data().sections) {
    if (auto record = GetSectionById(t, id)) out.push_back(std::move(*record));
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms < b.created_at_ms;
  });
  return out;
}

Result MemoryRepository::DeleteSection(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  auto  it = s.sections.find(id);
  if (it == s.sections.end()) return Result::Err(ErrorCode::NotFound, "section '" + id + "' not found");

  const auto name = it->second.name;
  Remember(tx, s.sections, id);
  Remember(tx, s.section_name_to_id, name);
  Remember(tx, s.section_members, id);
  s.sections.erase(id);
  s.section_name_to_id.erase(name);
  s.section_members.erase(id);
  return Result::Ok();
}

Result MemoryRepository::AppendSectionMember(Transaction& t, const std::string& section_id, const std::string& token, uint64_t cap) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  if (!s.sections.contains(section_id)) return Result::Err(ErrorCode::NotFound, "section '" + section_id + "' not found");

  Remember(tx, s.section_members, section_id);
  PushFrontCapped(s.section_members[section_id], token, cap);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListSectionMembers(Transaction& t, const std::string& section_id, uint64_t limit) {
  auto& s  = TX(t).Data();
  auto  it = s.section_members.find(section_id);
  if (it == s.section_members.end()) return {};
  return Head(it->second, limit);
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result MemoryRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  auto& tx = TX(t);
  Remember(tx, tx.Data().settings, key);
  tx.Data().settings[key] = value;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetSetting(Transaction& t, const std::string& key) {
  auto& s  = TX(t).Data();
  auto  it = s.settings.find(key);
  if (it == s.settings.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Credits
// ------------------------------------------------------------------

int64_t MemoryRepository::GetCredits(Transaction& t, int64_t user_id) {
  auto& s  = TX(t).Data();
  auto  it = s.credits.find(user_id);
  return it == s.credits.end() ? 0 : it->second;
}

Result MemoryRepository::AddCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  Remember(tx, s.credits, user_id);
  balance = (s.credits[user_id] += amount);
  return Result::Ok();
}

Result MemoryRepository::ChargeCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  balance  = GetCredits(t, user_id);
  if (balance < amount) {
    return Result::Err(ErrorCode::Conflict, "insufficient balance");
  }
  Remember(tx, s.credits, user_id);
  balance = (s.credits[user_id] -= amount);
  return Result::Ok();
}

std::vector<model::CreditRecord> MemoryRepository::ListCreditBalances(Transaction& t, uint64_t limit) {
  std::vector<model::CreditRecord> out;
  for (const auto& [user_id, balance] : TX(t).Data().credits) {
    out.push_back({user_id, balance});
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.balance != b.balance) return a.balance > b.balance;
    return a.user_id < b.user_id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Payment requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  RememberValue(tx, s.next_payment_id);
  r.id = s.next_payment_id++;
  Remember(tx, s.payments, r.id);
  s.payments[r.id] = r;
  return Result::Ok();
}

std::optional<model::PaymentRecord> MemoryRepository::GetPayment(Transaction& t, uint64_t id) {
  auto& s  = TX(t).Data();
  auto  it = s.payments.find(id);
  if (it == s.payments.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSetPayment(Transaction& t, const model::PaymentRecord& updated, streamgate::v1::PaymentStatus expected) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  auto  it = s.payments.find(updated.id);
  if (it == s.payments.end()) return Result::Err(ErrorCode::NotFound, "payment request not found");
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "payment status changed");

  Remember(tx, s.payments, updated.id);
  s.payments[updated.id] = updated;
  return Result::Ok();
}

std::vector<model::PaymentRecord> MemoryRepository::ListPayments(Transaction& t, std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit) {
  std::vector<model::PaymentRecord> out;
  const auto&                       payments = TX(t).Data().payments;
  for (auto it = payments.rbegin(); it != payments.rend() && out.size() < limit; ++it) {
    if (status && it->second.status != *status) continue;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::PutPendingSubmission(Transaction& t, const model::PendingSubmissionRecord& r) {
  auto& tx = TX(t);
  Remember(tx, tx.Data().pending_submissions, r.user_id);
  tx.Data().pending_submissions[r.user_id] = r;
  return Result::Ok();
}

std::optional<model::PendingSubmissionRecord> MemoryRepository::GetPendingSubmission(Transaction& t, int64_t user_id, uint64_t now_ms) {
  auto& s  = TX(t).Data();
  auto  it = s.pending_submissions.find(user_id);
  if (it == s.pending_submissions.end() || it->second.expires_at_ms <= now_ms) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeletePendingSubmission(Transaction& t, int64_t user_id) {
  auto& tx = TX(t);
  Remember(tx, tx.Data().pending_submissions, user_id);
  tx.Data().pending_submissions.erase(user_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Engagement
// ------------------------------------------------------------------

Result MemoryRepository::IncrementView(Transaction& t, const std::string& token, const std::optional<std::string>& viewer_fingerprint,
                                       model::ViewCountRecord& counts) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  Remember(tx, s.view_totals, token);
  ++s.view_totals[token];

  if (viewer_fingerprint && !viewer_fingerprint->empty()) {
    auto& viewers = s.view_viewers[token];
    if (viewers.insert(*viewer_fingerprint).second) {
      // Undo only this fingerprint; the rest of the set is untouched.
      tx.OnRollback([&views = s.view_viewers, token, fingerprint = *viewer_fingerprint] {
        auto it = views.find(token);
        if (it == views.end()) return;
        it->second.erase(fingerprint);
        if (it->second.empty()) views.erase(it);
      });
    }
  }

  counts = GetViews(t, token);
  return Result::Ok();
}

model::ViewCountRecord MemoryRepository::GetViews(Transaction& t, const std::string& token) {
  auto&                  s = TX(t).Data();
  model::ViewCountRecord counts;
  if (auto it = s.view_totals.find(token); it != s.view_totals.end()) counts.total = it->second;
  if (auto it = s.view_viewers.find(token); it != s.view_viewers.end()) counts.unique_viewers = it->second.size();
  return counts;
}

Result MemoryRepository::SetReaction(Transaction& t, const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  Remember(tx, s.reactions, token);
  if (reaction == streamgate::v1::REACTION_NONE) {
    if (auto it = s.reactions.find(token); it != s.reactions.end()) it->second.erase(user_id);
  } else {
    s.reactions[token][user_id] = reaction;
  }
  return Result::Ok();
}

model::ReactionCountRecord MemoryRepository::GetReactions(Transaction& t, const std::string& token, int64_t user_id) {
  auto&                      s = TX(t).Data();
  model::ReactionCountRecord counts;
  auto                       it = s.reactions.find(token);
  if (it == s.reactions.end()) return counts;

  for (const auto& [uid, choice] : it->second) {
    if (choice == streamgate::v1::REACTION_LIKE) ++counts.likes;
    if (choice == streamgate::v1::REACTION_DISLIKE) ++counts.dislikes;
    if (uid == user_id) counts.current = choice;
  }
  return counts;
}

// ------------------------------------------------------------------
// Premium users
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPremiumUser(Transaction& t, const model::PremiumUserRecord& r) {
  auto& tx = TX(t);
  Remember(tx, tx.Data().premium_users, r.user_id);
  tx.Data().premium_users[r.user_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeletePremiumUser(Transaction& t, int64_t user_id) {
  auto& tx = TX(t);
  auto& s  = tx.Data();
  if (!s.premium_users.contains(user_id)) return Result::Err(ErrorCode::NotFound, "premium user not found");
  Remember(tx, s.premium_users, user_id);
  s.premium_users.erase(user_id);
  return Result::Ok();
}

std::optional<model::PremiumUserRecord> MemoryRepository::GetPremiumUser(Transaction& t, int64_t user_id) {
  auto& s  = TX(t).Data();
  auto  it = s.premium_users.find(user_id);
  if (it == s.premium_users.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PremiumUserRecord> MemoryRepository::ListPremiumUsers(Transaction& t) {
  std::vector<model::PremiumUserRecord> out;
  for (const auto& [_, record] : TX(t).Data().premium_users) out.push_back(record);
  return out;
}

} // namespace streamgate::db::memory
