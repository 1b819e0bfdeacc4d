#include "token_store.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/core/store_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/token.hpp"

namespace streamgate::core {

using namespace streamgate::v1;
using detail::ThrowIfDbError;

namespace {

void RequireToken(const std::string& token) {
  if (token.empty()) {
    throw util::InvalidArgument("token must not be empty");
  }
}

uint64_t ToMillis(std::chrono::seconds s) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(s).count());
}

} // namespace

TokenStore::TokenStore(std::shared_ptr<db::Repository> repository, TokenStoreOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (!repository_) {
    throw std::invalid_argument("TokenStore: repository is required");
  }
  if (!options_.clock) {
    options_.clock = util::Now;
  }
  if (options_.history_limit == 0) {
    throw std::invalid_argument("TokenStore: history limit must be positive");
  }
}

uint64_t TokenStore::NowMs() const {
  return util::ToUnixMillis(options_.clock());
}

uint64_t TokenStore::ExpiryFor(std::optional<std::chrono::seconds> ttl) const {
  const auto effective = ttl.value_or(options_.default_ttl);
  if (effective.count() <= 0) {
    return 0;
  }
  return NowMs() + ToMillis(effective);
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

void TokenStore::PutLocked(db::Transaction& tx, const std::string& token, const MediaReference& reference, uint64_t expires_at_ms) {
  db::model::ReferenceRecord record;
  record.token         = token;
  record.reference     = reference;
  record.expires_at_ms = expires_at_ms;
  if (record.reference.created_at_ms() == 0) {
    record.reference.set_created_at_ms(NowMs());
  }

  ThrowIfDbError(repository_->UpsertReference(tx, record), "put reference");
  ThrowIfDbError(repository_->AppendHistory(tx, token, options_.history_limit), "append history");

  if (reference.has_section_id() && !reference.section_id().empty()) {
    const auto added = repository_->AppendSectionMember(tx, reference.section_id(), token, options_.history_limit);
    if (added.Is(db::ErrorCode::NotFound)) {
      STREAMGATE_LOG_WARN("reference names a missing section", {observability::StringField("section", reference.section_id())});
    } else {
      ThrowIfDbError(added, "append section member");
    }
  }
}

void TokenStore::Put(const std::string& token, const MediaReference& reference, std::optional<std::chrono::seconds> ttl) {
  RequireToken(token);

  auto tx = repository_->Begin();
  PutLocked(*tx, token, reference, ExpiryFor(ttl));
  tx->Commit();
}

IngestResult TokenStore::Ingest(MediaReference reference, std::optional<std::chrono::seconds> ttl, bool with_premium_alias) {
  if (reference.fallback_locator().empty() && reference.primary_locator().message_id() == 0) {
    throw util::InvalidArgument("reference carries no locator");
  }

  if (!reference.has_section_id()) {
    std::shared_lock lock(current_section_mutex_);
    if (current_section_) {
      reference.set_section_id(current_section_->id);
      reference.set_section_name(current_section_->name);
    }
  }
  if (reference.created_at_ms() == 0) {
    reference.set_created_at_ms(NowMs());
  }

  IngestResult result;
  result.token     = util::MintToken();
  result.reference = reference;
  result.reference.set_access_tier(ACCESS_TIER_NORMAL);

  const auto expires_at_ms = ExpiryFor(ttl);

  auto tx = repository_->Begin();
  PutLocked(*tx, result.token, result.reference, expires_at_ms);
  if (with_premium_alias) {
    result.premium_token = util::MintToken();
    auto premium         = result.reference;
    premium.set_access_tier(ACCESS_TIER_PREMIUM);
    PutLocked(*tx, result.premium_token, premium, expires_at_ms);
  }
  tx->Commit();

  STREAMGATE_LOG_INFO("reference ingested", {observability::StringField("token", result.token), observability::BoolField("premium_alias", with_premium_alias),
                                             observability::StringField("section", result.reference.section_id())});
  return result;
}

std::optional<MediaReference> TokenStore::Get(const std::string& token, std::chrono::seconds grace) {
  if (token.empty()) {
    return std::nullopt;
  }

  uint64_t visible_at = NowMs();
  if (grace.count() > 0) {
    const auto grace_ms = ToMillis(grace);
    visible_at          = visible_at > grace_ms ? visible_at - grace_ms : 0;
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetReference(*tx, token, visible_at);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return record->reference;
}

std::vector<std::string> TokenStore::ListRecent(uint64_t limit) {
  if (limit == 0 || limit > options_.history_limit) {
    limit = options_.history_limit;
  }

  const auto now = NowMs();

  auto                     tx = repository_->Begin();
  std::vector<std::string> live;
  for (auto& token : repository_->ListHistory(*tx, options_.history_limit)) {
    if (live.size() >= limit) break;
    if (repository_->GetReference(*tx, token, now)) {
      live.push_back(std::move(token));
    }
  }
  tx->Commit();
  return live;
}

uint64_t TokenStore::PurgeExpired() {
  uint64_t deleted = 0;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteExpiredReferences(*tx, NowMs(), deleted), "purge expired references");
  tx->Commit();

  if (deleted > 0) {
    STREAMGATE_LOG_INFO("expired references purged", {observability::UintField("removed", deleted)});
  }
  return deleted;
}

// ------------------------------------------------------------------
// Sections
// ------------------------------------------------------------------

std::optional<db::model::SectionRecord> TokenStore::FindSection(db::Transaction& tx, const std::string& name_or_slug) {
  const auto normalized = util::NormalizeSectionName(name_or_slug);
  if (normalized.empty()) {
    return std::nullopt;
  }
  if (auto by_name = repository_->GetSectionByName(tx, normalized)) {
    return by_name;
  }
  const auto slug = util::SectionSlug(name_or_slug);
  if (slug.empty()) {
    return std::nullopt;
  }
  return repository_->GetSectionById(tx, slug);
}

SectionOutcome TokenStore::CreateSection(const std::string& name) {
  db::model::SectionRecord record;
  record.name = util::NormalizeSectionName(name);
  record.id   = util::SectionSlug(name);
  if (record.id.empty()) {
    throw util::InvalidArgument("section name '" + name + "' has no usable characters");
  }
  record.created_at_ms = NowMs();

  SectionOutcome outcome;

  auto       tx       = repository_->Begin();
  const auto inserted = repository_->InsertSection(*tx, record);
  if (inserted.Is(db::ErrorCode::AlreadyExists)) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kNameConflict;
    outcome.section.set_id(record.id);
    outcome.section.set_name(record.name);
    return outcome;
  }
  ThrowIfDbError(inserted, "create section");
  tx->Commit();

  STREAMGATE_LOG_INFO("section created", {observability::StringField("id", record.id), observability::StringField("name", record.name)});
  outcome.section = detail::ToProto(record);
  return outcome;
}

bool TokenStore::DeleteSection(const std::string& name_or_slug) {
  auto tx      = repository_->Begin();
  auto section = FindSection(*tx, name_or_slug);
  if (!section) {
    tx->Rollback();
    return false;
  }

  const auto deleted = repository_->DeleteSection(*tx, section->id);
  if (deleted.Is(db::ErrorCode::NotFound)) {
    tx->Rollback();
    return false;
  }
  ThrowIfDbError(deleted, "delete section");
  tx->Commit();

  {
    std::unique_lock lock(current_section_mutex_);
    if (current_section_ && current_section_->id == section->id) {
      current_section_.reset();
    }
  }

  STREAMGATE_LOG_INFO("section deleted", {observability::StringField("id", section->id)});
  return true;
}

bool TokenStore::SectionExists(const std::string& name_or_slug) {
  auto tx    = repository_->Begin();
  auto found = FindSection(*tx, name_or_slug).has_value();
  tx->Commit();
  return found;
}

std::optional<Section> TokenStore::GetSectionById(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSectionById(*tx, id);
  tx->Commit();
  if (!record) return std::nullopt;
  return detail::ToProto(*record);
}

std::optional<Section> TokenStore::GetSectionByName(const std::string& name) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSectionByName(*tx, util::NormalizeSectionName(name));
  tx->Commit();
  if (!record) return std::nullopt;
  return detail::ToProto(*record);
}

std::vector<Section> TokenStore::ListSections() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSections(*tx);
  tx->Commit();

  std::vector<Section> sections;
  sections.reserve(records.size());
  for (const auto& record : records) {
    sections.push_back(detail::ToProto(record));
  }
  return sections;
}

std::optional<std::vector<std::string>> TokenStore::ListSection(const std::string& name_or_slug, uint64_t limit) {
  if (limit == 0 || limit > options_.history_limit) {
    limit = options_.history_limit;
  }

  const auto now = NowMs();

  auto tx      = repository_->Begin();
  auto section = FindSection(*tx, name_or_slug);
  if (!section) {
    tx->Rollback();
    return std::nullopt;
  }

  std::vector<std::string> live;
  for (auto& token : repository_->ListSectionMembers(*tx, section->id, options_.history_limit)) {
    if (live.size() >= limit) break;
    if (repository_->GetReference(*tx, token, now)) {
      live.push_back(std::move(token));
    }
  }
  tx->Commit();
  return live;
}

SectionOutcome TokenStore::SetCurrentSection(const std::string& name_or_slug) {
  SectionOutcome outcome;

  auto tx      = repository_->Begin();
  auto section = FindSection(*tx, name_or_slug);
  tx->Commit();

  if (!section) {
    outcome.error = util::ErrorKind::kNotFound;
    return outcome;
  }

  {
    std::unique_lock lock(current_section_mutex_);
    current_section_ = CurrentSectionRef{section->id, section->name};
  }

  STREAMGATE_LOG_INFO("current section set", {observability::StringField("id", section->id)});
  outcome.section = detail::ToProto(*section);
  return outcome;
}

void TokenStore::ClearCurrentSection() {
  std::unique_lock lock(current_section_mutex_);
  current_section_.reset();
}

std::optional<Section> TokenStore::CurrentSection() {
  std::optional<CurrentSectionRef> current;
  {
    std::shared_lock lock(current_section_mutex_);
    current = current_section_;
  }
  if (!current) {
    return std::nullopt;
  }
  return GetSectionById(current->id);
}

// ------------------------------------------------------------------
// Premium users
// ------------------------------------------------------------------

PremiumUser TokenStore::AddPremiumUser(int64_t user_id, std::optional<uint32_t> period_days) {
  if (user_id <= 0) {
    throw util::InvalidArgument("user id must be positive");
  }
  if (period_days && *period_days == 0) {
    throw util::InvalidArgument("premium period must be at least one day");
  }

  db::model::PremiumUserRecord record;
  record.user_id = user_id;
  if (period_days) {
    record.expires_at_ms = NowMs() + ToMillis(std::chrono::hours(24) * static_cast<int64_t>(*period_days));
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertPremiumUser(*tx, record), "add premium user");
  tx->Commit();

  STREAMGATE_LOG_INFO("premium user added", {observability::IntField("user_id", user_id), observability::UintField("expires_at_ms", record.expires_at_ms.value_or(0))});

  PremiumUser user;
  user.set_user_id(user_id);
  user.set_expires_at_ms(record.expires_at_ms.value_or(0));
  return user;
}

bool TokenStore::RemovePremiumUser(int64_t user_id) {
  auto       tx      = repository_->Begin();
  const auto removed = repository_->DeletePremiumUser(*tx, user_id);
  if (removed.Is(db::ErrorCode::NotFound)) {
    tx->Rollback();
    return false;
  }
  ThrowIfDbError(removed, "remove premium user");
  tx->Commit();
  return true;
}

bool TokenStore::IsPremium(int64_t user_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPremiumUser(*tx, user_id);
  tx->Commit();

  if (!record) return false;
  return !record->expires_at_ms || *record->expires_at_ms > NowMs();
}

std::vector<PremiumUser> TokenStore::ListPremiumUsers() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListPremiumUsers(*tx);
  tx->Commit();

  std::vector<PremiumUser> users;
  users.reserve(records.size());
  for (const auto& record : records) {
    PremiumUser user;
    user.set_user_id(record.user_id);
    user.set_expires_at_ms(record.expires_at_ms.value_or(0));
    users.push_back(std::move(user));
  }
  return users;
}

// ------------------------------------------------------------------
// Engagement
// ------------------------------------------------------------------

ViewCounts TokenStore::IncrementView(const std::string& token, const std::optional<std::string>& viewer_fingerprint) {
  RequireToken(token);

  std::optional<std::string> fingerprint;
  if (viewer_fingerprint && !viewer_fingerprint->empty()) {
    fingerprint = viewer_fingerprint;
  }

  db::model::ViewCountRecord counts;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->IncrementView(*tx, token, fingerprint, counts), "increment view");
  tx->Commit();

  ViewCounts out;
  out.set_total(counts.total);
  out.set_unique_viewers(counts.unique_viewers);
  return out;
}

ViewCounts TokenStore::GetViews(const std::string& token) {
  auto tx     = repository_->Begin();
  auto counts = repository_->GetViews(*tx, token);
  tx->Commit();

  ViewCounts out;
  out.set_total(counts.total);
  out.set_unique_viewers(counts.unique_viewers);
  return out;
}

ReactionCounts TokenStore::SetReaction(const std::string& token, int64_t user_id, Reaction reaction) {
  RequireToken(token);
  if (!Reaction_IsValid(reaction)) {
    throw util::InvalidArgument("unknown reaction");
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->SetReaction(*tx, token, user_id, reaction), "set reaction");
  auto counts = repository_->GetReactions(*tx, token, user_id);
  tx->Commit();

  ReactionCounts out;
  out.set_likes(counts.likes);
  out.set_dislikes(counts.dislikes);
  out.set_current(counts.current);
  return out;
}

ReactionCounts TokenStore::GetReactions(const std::string& token, int64_t user_id) {
  auto tx     = repository_->Begin();
  auto counts = repository_->GetReactions(*tx, token, user_id);
  tx->Commit();

  ReactionCounts out;
  out.set_likes(counts.likes);
  out.set_dislikes(counts.dislikes);
  out.set_current(counts.current);
  return out;
}

} // namespace streamgate::core
