#include "pg_repository.hpp"

namespace streamgate::db::postgres {

namespace {

constexpr const char* kSelectPayment =
    "SELECT id,user_id,amount_minor,credits,status,note,handled_by,created_at_ms,updated_at_ms FROM payment_request ";

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) || dynamic_cast<const pqxx::check_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename T>
std::optional<T> Opt(bool present, const T& value) {
  return present ? std::optional<T>(value) : std::nullopt;
}

model::ReferenceRecord ReadReference(const pqxx::row& row) {
  model::ReferenceRecord r;
  r.token   = row[0].c_str();
  auto& ref = r.reference;
  ref.mutable_primary_locator()->set_chat_id(row[1].as<int64_t>());
  ref.mutable_primary_locator()->set_message_id(row[2].as<int64_t>());
  ref.set_fallback_locator(row[3].c_str());
  ref.set_unique_id(row[4].c_str());
  if (!row[5].is_null()) ref.set_file_name(row[5].c_str());
  if (!row[6].is_null()) ref.set_mime_type(row[6].c_str());
  if (!row[7].is_null()) ref.set_size_bytes(row[7].as<uint64_t>());
  ref.set_media_kind(static_cast<streamgate::v1::MediaKind>(row[8].as<int>()));
  ref.set_access_tier(static_cast<streamgate::v1::AccessTier>(row[9].as<int>()));
  ref.set_created_at_ms(row[10].as<uint64_t>());
  if (!row[11].is_null()) ref.set_section_id(row[11].c_str());
  if (!row[12].is_null()) ref.set_section_name(row[12].c_str());
  r.expires_at_ms = row[13].as<uint64_t>();
  return r;
}

model::PaymentRecord ReadPayment(const pqxx::row& row) {
  model::PaymentRecord r;
  r.id            = row[0].as<uint64_t>();
  r.user_id       = row[1].as<int64_t>();
  r.amount_minor  = row[2].as<int64_t>();
  r.credits       = row[3].as<int64_t>();
  r.status        = static_cast<streamgate::v1::PaymentStatus>(row[4].as<int>());
  r.note          = row[5].c_str();
  r.handled_by    = row[6].as<int64_t>();
  r.created_at_ms = row[7].as<uint64_t>();
  r.updated_at_ms = row[8].as<uint64_t>();
  return r;
}

model::SectionRecord ReadSection(const pqxx::row& row) {
  return {row[0].c_str(), row[1].c_str(), row[2].as<uint64_t>(), row[3].as<uint64_t>()};
}

model::PremiumUserRecord ReadPremiumUser(const pqxx::row& row) {
  model::PremiumUserRecord r;
  r.user_id = row[0].as<int64_t>();
  if (!row[1].is_null()) r.expires_at_ms = row[1].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

Result PgRepository::UpsertReference(Transaction& t, const model::ReferenceRecord& r) {
  const auto& ref = r.reference;
  try {
    TX(t).Work().exec_params(
        "INSERT INTO media_reference(token,chat_id,message_id,fallback_locator,unique_id,file_name,mime_type,size_bytes,"
        "media_kind,access_tier,created_at_ms,section_id,section_name,expires_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14) "
        "ON CONFLICT(token) DO UPDATE SET chat_id=EXCLUDED.chat_id, message_id=EXCLUDED.message_id, "
        "fallback_locator=EXCLUDED.fallback_locator, unique_id=EXCLUDED.unique_id, file_name=EXCLUDED.file_name, "
        "mime_type=EXCLUDED.mime_type, size_bytes=EXCLUDED.size_bytes, media_kind=EXCLUDED.media_kind, "
        "access_tier=EXCLUDED.access_tier, created_at_ms=EXCLUDED.created_at_ms, section_id=EXCLUDED.section_id, "
        "section_name=EXCLUDED.section_name, expires_at_ms=EXCLUDED.expires_at_ms",
        r.token, ref.primary_locator().chat_id(), ref.primary_locator().message_id(), ref.fallback_locator(), ref.unique_id(),
        Opt(ref.has_file_name(), ref.file_name()), Opt(ref.has_mime_type(), ref.mime_type()), Opt(ref.has_size_bytes(), ref.size_bytes()),
        static_cast<int>(ref.media_kind()), static_cast<int>(ref.access_tier()), ref.created_at_ms(), Opt(ref.has_section_id(), ref.section_id()),
        Opt(ref.has_section_name(), ref.section_name()), r.expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReferenceRecord> PgRepository::GetReference(Transaction& t, const std::string& token, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("get_reference", token, now_ms);
  if (res.empty()) return std::nullopt;
  return ReadReference(res[0]);
}

Result PgRepository::DeleteExpiredReferences(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM media_reference WHERE expires_at_ms>0 AND expires_at_ms<=$1", now_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// History / sections
// ------------------------------------------------------------------

Result PgRepository::AppendHistory(Transaction& t, const std::string& token, uint64_t cap) {
  try {
    auto& w = TX(t).Work();
    w.exec_params("DELETE FROM history WHERE token=$1", token);
    w.exec_params("INSERT INTO history(token) VALUES($1)", token);
    if (cap > 0) {
      w.exec_params("DELETE FROM history WHERE seq <= (SELECT seq FROM history ORDER BY seq DESC LIMIT 1 OFFSET $1)", cap);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListHistory(Transaction& t, uint64_t limit) {
  auto res = TX(t).Work().exec_params("SELECT token FROM history ORDER BY seq DESC LIMIT $1", limit);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

Result PgRepository::InsertSection(Transaction& t, const model::SectionRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO section(id,name,created_at_ms) VALUES($1,$2,$3)", r.id, r.name, r.created_at_ms);
    return Result::Ok();
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, "section '" + r.name + "' already exists");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SectionRecord> PgRepository::GetSectionById(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT s.id,s.name,s.created_at_ms,(SELECT COUNT(*) FROM section_member m WHERE m.section_id=s.id) FROM section s WHERE s.id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadSection(res[0]);
}

std::optional<model::SectionRecord> PgRepository::GetSectionByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params(
      "SELECT s.id,s.name,s.created_at_ms,(SELECT COUNT(*) FROM section_member m WHERE m.section_id=s.id) FROM section s WHERE s.name=$1",
      name);
  if (res.empty()) return std::nullopt;
  return ReadSection(res[0]);
}

std::vector<model::SectionRecord> PgRepository::ListSections(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT s.id,s.name,s.created_at_ms,(SELECT COUNT(*) FROM section_member m WHERE m.section_id=s.id) FROM section s "
      "ORDER BY s.created_at_ms,s.id");

  std::vector<model::SectionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSection(row));
  return out;
}

Result PgRepository::DeleteSection(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM section WHERE id=$1", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "section '" + id + "' not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendSectionMember(Transaction& t, const std::string& section_id, const std::string& token, uint64_t cap) {
  try {
    auto& w = TX(t).Work();
    if (w.exec_params("SELECT 1 FROM section WHERE id=$1 FOR SHARE", section_id).empty()) {
      return Result::Err(ErrorCode::NotFound, "section '" + section_id + "' not found");
    }
    w.exec_params("DELETE FROM section_member WHERE section_id=$1 AND token=$2", section_id, token);
    w.exec_params(
        "INSERT INTO section_member(section_id,seq,token) "
        "SELECT $1, COALESCE(MAX(seq),0)+1, $2 FROM section_member WHERE section_id=$1",
        section_id, token);
    if (cap > 0) {
      w.exec_params(
          "DELETE FROM section_member WHERE section_id=$1 AND seq <= "
          "(SELECT seq FROM section_member WHERE section_id=$1 ORDER BY seq DESC LIMIT 1 OFFSET $2)",
          section_id, cap);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListSectionMembers(Transaction& t, const std::string& section_id, uint64_t limit) {
  auto res = TX(t).Work().exec_params("SELECT token FROM section_member WHERE section_id=$1 ORDER BY seq DESC LIMIT $2", section_id, limit);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result PgRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  try {
    TX(t).Work().exec_params("INSERT INTO setting(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value", key, value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetSetting(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params("SELECT value FROM setting WHERE key=$1", key);
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

// ------------------------------------------------------------------
// Credits
// ------------------------------------------------------------------

int64_t PgRepository::GetCredits(Transaction& t, int64_t user_id) {
  auto res = TX(t).Work().exec_prepared("get_credits", user_id);
  if (res.empty()) return 0;
  return res[0][0].as<int64_t>();
}

Result PgRepository::AddCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  try {
    auto res = TX(t).Work().exec_prepared("add_credits", user_id, amount);
    balance  = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ChargeCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  try {
    auto res = TX(t).Work().exec_prepared("charge_credits", user_id, amount);
    if (!res.empty()) {
      balance = res[0][0].as<int64_t>();
      return Result::Ok();
    }
  } catch (const std::exception& e) {
    return Translate(e);
  }

  balance = GetCredits(t, user_id);
  return Result::Err(ErrorCode::Conflict, "insufficient balance");
}

std::vector<model::CreditRecord> PgRepository::ListCreditBalances(Transaction& t, uint64_t limit) {
  auto res = TX(t).Work().exec_params("SELECT user_id,balance FROM credit_balance ORDER BY balance DESC, user_id LIMIT $1", limit);

  std::vector<model::CreditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].as<int64_t>(), row[1].as<int64_t>()});
  return out;
}

// ------------------------------------------------------------------
// Payment requests
// ------------------------------------------------------------------

Result PgRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO payment_request(user_id,amount_minor,credits,status,note,handled_by,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id",
        r.user_id, r.amount_minor, r.credits, static_cast<int>(r.status), r.note, r.handled_by, r.created_at_ms, r.updated_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPayment(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kSelectPayment) + "WHERE id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadPayment(res[0]);
}

Result PgRepository::CompareAndSetPayment(Transaction& t, const model::PaymentRecord& r, streamgate::v1::PaymentStatus expected) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE payment_request SET amount_minor=$2,credits=$3,status=$4,note=$5,handled_by=$6,updated_at_ms=$7 WHERE id=$1 AND status=$8",
        r.id, r.amount_minor, r.credits, static_cast<int>(r.status), r.note, r.handled_by, r.updated_at_ms, static_cast<int>(expected));
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetPayment(t, r.id)) return Result::Err(ErrorCode::NotFound, "payment request not found");
  return Result::Err(ErrorCode::Conflict, "payment status changed");
}

std::vector<model::PaymentRecord> PgRepository::ListPayments(Transaction& t, std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit) {
  std::optional<int> filter;
  if (status) filter = static_cast<int>(*status);

  auto res = TX(t).Work().exec_params(std::string(kSelectPayment) + "WHERE ($1::smallint IS NULL OR status=$1) ORDER BY id DESC LIMIT $2",
                                      filter, limit);

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPayment(row));
  return out;
}

Result PgRepository::PutPendingSubmission(Transaction& t, const model::PendingSubmissionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO pending_submission(user_id,request_id,expires_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(user_id) DO UPDATE SET request_id=EXCLUDED.request_id, expires_at_ms=EXCLUDED.expires_at_ms",
        r.user_id, r.request_id, r.expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PendingSubmissionRecord> PgRepository::GetPendingSubmission(Transaction& t, int64_t user_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params("SELECT user_id,request_id,expires_at_ms FROM pending_submission WHERE user_id=$1 AND expires_at_ms>$2",
                                      user_id, now_ms);
  if (res.empty()) return std::nullopt;
  return model::PendingSubmissionRecord{res[0][0].as<int64_t>(), res[0][1].as<uint64_t>(), res[0][2].as<uint64_t>()};
}

Result PgRepository::DeletePendingSubmission(Transaction& t, int64_t user_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM pending_submission WHERE user_id=$1", user_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Engagement
// ------------------------------------------------------------------

Result PgRepository::IncrementView(Transaction& t, const std::string& token, const std::optional<std::string>& viewer_fingerprint,
                                   model::ViewCountRecord& counts) {
  try {
    auto& w = TX(t).Work();
    w.exec_params("INSERT INTO view_counter(token,total) VALUES($1,1) ON CONFLICT(token) DO UPDATE SET total=view_counter.total+1", token);
    if (viewer_fingerprint && !viewer_fingerprint->empty()) {
      w.exec_params("INSERT INTO view_viewer(token,fingerprint) VALUES($1,$2) ON CONFLICT DO NOTHING", token, *viewer_fingerprint);
    }
  } catch (const std::exception& e) {
    return Translate(e);
  }
  counts = GetViews(t, token);
  return Result::Ok();
}

model::ViewCountRecord PgRepository::GetViews(Transaction& t, const std::string& token) {
  auto res = TX(t).Work().exec_params(
      "SELECT COALESCE((SELECT total FROM view_counter WHERE token=$1),0), (SELECT COUNT(*) FROM view_viewer WHERE token=$1)", token);

  model::ViewCountRecord counts;
  counts.total          = res[0][0].as<uint64_t>();
  counts.unique_viewers = res[0][1].as<uint64_t>();
  return counts;
}

Result PgRepository::SetReaction(Transaction& t, const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction) {
  try {
    if (reaction == streamgate::v1::REACTION_NONE) {
      TX(t).Work().exec_params("DELETE FROM reaction WHERE token=$1 AND user_id=$2", token, user_id);
    } else {
      TX(t).Work().exec_params(
          "INSERT INTO reaction(token,user_id,choice) VALUES($1,$2,$3) ON CONFLICT(token,user_id) DO UPDATE SET choice=EXCLUDED.choice", token,
          user_id, static_cast<int>(reaction));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::ReactionCountRecord PgRepository::GetReactions(Transaction& t, const std::string& token, int64_t user_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT COALESCE(SUM(CASE WHEN choice=$2 THEN 1 ELSE 0 END),0), COALESCE(SUM(CASE WHEN choice=$3 THEN 1 ELSE 0 END),0), "
      "COALESCE(MAX(CASE WHEN user_id=$4 THEN choice ELSE 0 END),0) FROM reaction WHERE token=$1",
      token, static_cast<int>(streamgate::v1::REACTION_LIKE), static_cast<int>(streamgate::v1::REACTION_DISLIKE), user_id);

  model::ReactionCountRecord counts;
  counts.likes    = res[0][0].as<uint64_t>();
  counts.dislikes = res[0][1].as<uint64_t>();
  counts.current  = static_cast<streamgate::v1::Reaction>(res[0][2].as<int>());
  return counts;
}

// ------------------------------------------------------------------
// Premium users
// ------------------------------------------------------------------

Result PgRepository::UpsertPremiumUser(Transaction& t, const model::PremiumUserRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO premium_user(user_id,expires_at_ms) VALUES($1,$2) ON CONFLICT(user_id) DO UPDATE SET expires_at_ms=EXCLUDED.expires_at_ms",
        r.user_id, r.expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePremiumUser(Transaction& t, int64_t user_id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM premium_user WHERE user_id=$1", user_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "premium user not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PremiumUserRecord> PgRepository::GetPremiumUser(Transaction& t, int64_t user_id) {
  auto res = TX(t).Work().exec_params("SELECT user_id,expires_at_ms FROM premium_user WHERE user_id=$1", user_id);
  if (res.empty()) return std::nullopt;
  return ReadPremiumUser(res[0]);
}

std::vector<model::PremiumUserRecord> PgRepository::ListPremiumUsers(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT user_id,expires_at_ms FROM premium_user ORDER BY user_id");

  std::vector<model::PremiumUserRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPremiumUser(row));
  return out;
}

} // namespace streamgate::db::postgres
