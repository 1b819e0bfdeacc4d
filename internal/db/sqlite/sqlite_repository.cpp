#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace streamgate::db::sqlite {

using streamgate::db::ErrorCode;
using streamgate::db::Result;
using sql::Param;
using sql::Params;

namespace {

constexpr const char* kSelectReference =
    "SELECT token,chat_id,message_id,fallback_locator,unique_id,file_name,mime_type,size_bytes,media_kind,access_tier,"
    "created_at_ms,section_id,section_name,expires_at_ms FROM media_reference ";

constexpr const char* kSelectPayment =
    "SELECT id,user_id,amount_minor,credits,status,note,handled_by,created_at_ms,updated_at_ms FROM payment_request ";

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// Runs a statement that returns no rows (or whose rows are ignored).
Result Execute(sqlite3* db, const char* sql, const Params& params, uint64_t* changes = nullptr) {
  try {
    Statement st(db, sql);
    st.Bind(params);
    int rc = st.Step();
    while (rc == SQLITE_ROW) rc = st.Step();
    if (changes) *changes = static_cast<uint64_t>(sqlite3_changes(db));
    return Translate(db, rc);
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

// Runs a read; backend errors throw.
template <typename Fn>
void Query(sqlite3* db, const std::string& sql, const Params& params, Fn&& on_row) {
  Statement st(db, sql.c_str());
  st.Bind(params);
  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    on_row(st);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite query: ") + sqlite3_errmsg(db));
  }
}

Param OptText(bool present, const std::string& value) {
  return present ? Param{value} : Param{nullptr};
}

model::ReferenceRecord ReadReference(const Statement& st) {
  model::ReferenceRecord r;
  r.token   = st.Text(0);
  auto& ref = r.reference;
  ref.mutable_primary_locator()->set_chat_id(st.Int64(1));
  ref.mutable_primary_locator()->set_message_id(st.Int64(2));
  ref.set_fallback_locator(st.Text(3));
  ref.set_unique_id(st.Text(4));
  if (!st.IsNull(5)) ref.set_file_name(st.Text(5));
  if (!st.IsNull(6)) ref.set_mime_type(st.Text(6));
  if (!st.IsNull(7)) ref.set_size_bytes(static_cast<uint64_t>(st.Int64(7)));
  ref.set_media_kind(static_cast<streamgate::v1::MediaKind>(st.Int64(8)));
  ref.set_access_tier(static_cast<streamgate::v1::AccessTier>(st.Int64(9)));
  ref.set_created_at_ms(static_cast<uint64_t>(st.Int64(10)));
  if (!st.IsNull(11)) ref.set_section_id(st.Text(11));
  if (!st.IsNull(12)) ref.set_section_name(st.Text(12));
  r.expires_at_ms = static_cast<uint64_t>(st.Int64(13));
  return r;
}

model::PaymentRecord ReadPayment(const Statement& st) {
  model::PaymentRecord r;
  r.id            = static_cast<uint64_t>(st.Int64(0));
  r.user_id       = st.Int64(1);
  r.amount_minor  = st.Int64(2);
  r.credits       = st.Int64(3);
  r.status        = static_cast<streamgate::v1::PaymentStatus>(st.Int64(4));
  r.note          = st.Text(5);
  r.handled_by    = st.Int64(6);
  r.created_at_ms = static_cast<uint64_t>(st.Int64(7));
  r.updated_at_ms = static_cast<uint64_t>(st.Int64(8));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// References
// ------------------------------------------------------------------

Result SqliteRepository::UpsertReference(Transaction& t, const model::ReferenceRecord& r) {
  const auto& ref = r.reference;
  return Execute(TX(t).Handle(),
                 "INSERT INTO media_reference(token,chat_id,message_id,fallback_locator,unique_id,file_name,mime_type,size_bytes,"
                 "media_kind,access_tier,created_at_ms,section_id,section_name,expires_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                 "ON CONFLICT(token) DO UPDATE SET chat_id=excluded.chat_id, message_id=excluded.message_id, "
                 "fallback_locator=excluded.fallback_locator, unique_id=excluded.unique_id, file_name=excluded.file_name, "
                 "mime_type=excluded.mime_type, size_bytes=excluded.size_bytes, media_kind=excluded.media_kind, "
                 "access_tier=excluded.access_tier, created_at_ms=excluded.created_at_ms, section_id=excluded.section_id, "
                 "section_name=excluded.section_name, expires_at_ms=excluded.expires_at_ms;",
                 {r.token, int64_t{ref.primary_locator().chat_id()}, int64_t{ref.primary_locator().message_id()}, ref.fallback_locator(),
                  ref.unique_id(), OptText(ref.has_file_name(), ref.file_name()), OptText(ref.has_mime_type(), ref.mime_type()),
                  ref.has_size_bytes() ? Param{uint64_t{ref.size_bytes()}} : Param{nullptr}, int64_t{ref.media_kind()},
                  int64_t{ref.access_tier()}, uint64_t{ref.created_at_ms()}, OptText(ref.has_section_id(), ref.section_id()),
                  OptText(ref.has_section_name(), ref.section_name()), r.expires_at_ms});
}

std::optional<model::ReferenceRecord> SqliteRepository::GetReference(Transaction& t, const std::string& token, uint64_t now_ms) {
  std::optional<model::ReferenceRecord> out;
  Query(TX(t).Handle(), std::string(kSelectReference) + "WHERE token=? AND (expires_at_ms=0 OR expires_at_ms>?);", {token, now_ms},
        [&](const Statement& st) { out = ReadReference(st); });
  return out;
}

Result SqliteRepository::DeleteExpiredReferences(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  return Execute(TX(t).Handle(), "DELETE FROM media_reference WHERE expires_at_ms>0 AND expires_at_ms<=?;", {now_ms}, &deleted);
}

// ------------------------------------------------------------------
// History / sections
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const std::string& token, uint64_t cap) {
  auto* db = TX(t).Handle();
  if (auto r = Execute(db, "DELETE FROM history WHERE token=?;", {token}); !r) return r;
  if (auto r = Execute(db, "INSERT INTO history(token) VALUES(?);", {token}); !r) return r;
  if (cap == 0) return Result::Ok();
  return Execute(db, "DELETE FROM history WHERE seq <= (SELECT seq FROM history ORDER BY seq DESC LIMIT 1 OFFSET ?);", {cap});
}

std::vector<std::string> SqliteRepository::ListHistory(Transaction& t, uint64_t limit) {
  std::vector<std::string> out;
  Query(TX(t).Handle(), "SELECT token FROM history ORDER BY seq DESC LIMIT ?;", {limit},
        [&](const Statement& st) { out.push_back(st.Text(0)); });
  return out;
}

Result SqliteRepository::InsertSection(Transaction& t, const model::SectionRecord& r) {
  auto result = Execute(TX(t).Handle(), "INSERT INTO section(id,name,created_at_ms) VALUES(?,?,?);", {r.id, r.name, r.created_at_ms});
  if (result.Is(ErrorCode::ConstraintViolation)) {
    return Result::Err(ErrorCode::AlreadyExists, "section '" + r.name + "' already exists");
  }
  return result;
}

std::optional<model::SectionRecord> SqliteRepository::GetSectionById(Transaction& t, const std::string& id) {
  std::optional<model::SectionRecord> out;
  Query(TX(t).Handle(),
        "SELECT s.id,s.name,s.created_at_ms,(SELECT COUNT(*) FROM section_member m WHERE m.section_id=s.id) FROM section s WHERE s.id=?;", {id},
        [&](const Statement& st) {
          out = model::SectionRecord{st.Text(0), st.Text(1), static_cast<uint64_t>(st.Int64(2)), static_cast<uint64_t>(st.Int64(3))};
        });
  return out;
}

std::optional<model::SectionRecord> SqliteRepository::GetSectionByName(Transaction& t, const std::string& name) {
  std::optional<std::string> id;
  Query(TX(t).Handle(), "SELECT id FROM section WHERE name=?;", {name}, [&](const Statement& st) { id = st.Text(0); });
  if (!id) return std::nullopt;
  return GetSectionById(t, *id);
}

std::vector<model::SectionRecord> SqliteRepository::ListSections(Transaction& t) {
  std::vector<model::SectionRecord> out;
  Query(TX(t).Handle(),
        "SELECT s.id,s.name,s.created_at_ms,(SELECT COUNT(*) FROM section_member m WHERE m.section_id=s.id) FROM section s "
        "ORDER BY s.created_at_ms,s.id;",
        {}, [&](const Statement& st) {
          out.push_back({st.Text(0), st.Text(1), static_cast<uint64_t>(st.Int64(2)), static_cast<uint64_t>(st.Int64(3))});
        });
  return out;
}

Result SqliteRepository::DeleteSection(Transaction& t, const std::string& id) {
  uint64_t changes = 0;
  auto     result  = Execute(TX(t).Handle(), "DELETE FROM section WHERE id=?;", {id}, &changes);
  if (result && changes == 0) return Result::Err(ErrorCode::NotFound, "section '" + id + "' not found");
  return result;
}

Result SqliteRepository::AppendSectionMember(Transaction& t, const std::string& section_id, const std::string& token, uint64_t cap) {
  auto* db     = TX(t).Handle();
  bool  exists = false;
  Query(db, "SELECT 1 FROM section WHERE id=?;", {section_id}, [&](const Statement&) { exists = true; });
  if (!exists) return Result::Err(ErrorCode::NotFound, "section '" + section_id + "' not found");

  if (auto r = Execute(db, "DELETE FROM section_member WHERE section_id=? AND token=?;", {section_id, token}); !r) return r;
  if (auto r = Execute(db,
                       "INSERT INTO section_member(section_id,seq,token) "
                       "SELECT ?, COALESCE(MAX(seq),0)+1, ? FROM section_member WHERE section_id=?;",
                       {section_id, token, section_id});
      !r) {
    return r;
  }
  if (cap == 0) return Result::Ok();
  return Execute(db,
                 "DELETE FROM section_member WHERE section_id=? AND seq <= "
                 "(SELECT seq FROM section_member WHERE section_id=? ORDER BY seq DESC LIMIT 1 OFFSET ?);",
                 {section_id, section_id, cap});
}

std::vector<std::string> SqliteRepository::ListSectionMembers(Transaction& t, const std::string& section_id, uint64_t limit) {
  std::vector<std::string> out;
  Query(TX(t).Handle(), "SELECT token FROM section_member WHERE section_id=? ORDER BY seq DESC LIMIT ?;", {section_id, limit},
        [&](const Statement& st) { out.push_back(st.Text(0)); });
  return out;
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

Result SqliteRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value) {
  return Execute(TX(t).Handle(), "INSERT INTO setting(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;", {key, value});
}

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
  std::optional<std::string> out;
  Query(TX(t).Handle(), "SELECT value FROM setting WHERE key=?;", {key}, [&](const Statement& st) { out = st.Text(0); });
  return out;
}

// ------------------------------------------------------------------
// Credits
// ------------------------------------------------------------------

int64_t SqliteRepository::GetCredits(Transaction& t, int64_t user_id) {
  int64_t balance = 0;
  Query(TX(t).Handle(), "SELECT balance FROM credit_balance WHERE user_id=?;", {user_id}, [&](const Statement& st) { balance = st.Int64(0); });
  return balance;
}

Result SqliteRepository::AddCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  auto* db = TX(t).Handle();
  try {
    Statement st(db,
                 "INSERT INTO credit_balance(user_id,balance) VALUES(?,?) "
                 "ON CONFLICT(user_id) DO UPDATE SET balance=balance+excluded.balance RETURNING balance;");
    st.Bind({user_id, amount});
    int rc = st.Step();
    if (rc != SQLITE_ROW) return Translate(db, rc);
    balance = st.Int64(0);
    return Translate(db, st.Step());
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SqliteRepository::ChargeCredits(Transaction& t, int64_t user_id, int64_t amount, int64_t& balance) {
  auto* db = TX(t).Handle();
  try {
    Statement st(db, "UPDATE credit_balance SET balance=balance-? WHERE user_id=? AND balance>=? RETURNING balance;");
    st.Bind({amount, user_id, amount});
    int rc = st.Step();
    if (rc == SQLITE_ROW) {
      balance = st.Int64(0);
      return Translate(db, st.Step());
    }
    if (rc != SQLITE_DONE) return Translate(db, rc);
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  balance = GetCredits(t, user_id);
  return Result::Err(ErrorCode::Conflict, "insufficient balance");
}

std::vector<model::CreditRecord> SqliteRepository::ListCreditBalances(Transaction& t, uint64_t limit) {
  std::vector<model::CreditRecord> out;
  Query(TX(t).Handle(), "SELECT user_id,balance FROM credit_balance ORDER BY balance DESC, user_id LIMIT ?;", {limit},
        [&](const Statement& st) { out.push_back({st.Int64(0), st.Int64(1)}); });
  return out;
}

// ------------------------------------------------------------------
// Payment requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto* db = TX(t).Handle();
  try {
    Statement st(db,
                 "INSERT INTO payment_request(user_id,amount_minor,credits,status,note,handled_by,created_at_ms,updated_at_ms) "
                 "VALUES(?,?,?,?,?,?,?,?) RETURNING id;");
    st.Bind({r.user_id, r.amount_minor, r.credits, int64_t{r.status}, r.note, r.handled_by, r.created_at_ms, r.updated_at_ms});
    int rc = st.Step();
    if (rc != SQLITE_ROW) return Translate(db, rc);
    r.id = static_cast<uint64_t>(st.Int64(0));
    return Translate(db, st.Step());
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<model::PaymentRecord> SqliteRepository::GetPayment(Transaction& t, uint64_t id) {
  std::optional<model::PaymentRecord> out;
  Query(TX(t).Handle(), std::string(kSelectPayment) + "WHERE id=?;", {id}, [&](const Statement& st) { out = ReadPayment(st); });
  return out;
}

Result SqliteRepository::CompareAndSetPayment(Transaction& t, const model::PaymentRecord& r, streamgate::v1::PaymentStatus expected) {
  uint64_t changes = 0;
  auto     result  = Execute(TX(t).Handle(),
                             "UPDATE payment_request SET amount_minor=?,credits=?,status=?,note=?,handled_by=?,updated_at_ms=? "
                                  "WHERE id=? AND status=?;",
                             {r.amount_minor, r.credits, int64_t{r.status}, r.note, r.handled_by, r.updated_at_ms, r.id, int64_t{expected}},
                             &changes);
  if (!result || changes > 0) return result;
  if (!GetPayment(t, r.id)) return Result::Err(ErrorCode::NotFound, "payment request not found");
  return Result::Err(ErrorCode::Conflict, "payment status changed");
}

std::vector<model::PaymentRecord> SqliteRepository::ListPayments(Transaction& t, std::optional<streamgate::v1::PaymentStatus> status, uint64_t limit) {
  std::vector<model::PaymentRecord> out;
  const Param                       filter = status ? Param{int64_t{*status}} : Param{nullptr};
  Query(TX(t).Handle(), std::string(kSelectPayment) + "WHERE (? IS NULL OR status=?) ORDER BY id DESC LIMIT ?;", {filter, filter, limit},
        [&](const Statement& st) { out.push_back(ReadPayment(st)); });
  return out;
}

Result SqliteRepository::PutPendingSubmission(Transaction& t, const model::PendingSubmissionRecord& r) {
  return Execute(TX(t).Handle(),
                 "INSERT INTO pending_submission(user_id,request_id,expires_at_ms) VALUES(?,?,?) "
                 "ON CONFLICT(user_id) DO UPDATE SET request_id=excluded.request_id, expires_at_ms=excluded.expires_at_ms;",
                 {r.user_id, r.request_id, r.expires_at_ms});
}

std::optional<model::PendingSubmissionRecord> SqliteRepository::GetPendingSubmission(Transaction& t, int64_t user_id, uint64_t now_ms) {
  std::optional<model::PendingSubmissionRecord> out;
  Query(TX(t).Handle(), "SELECT user_id,request_id,expires_at_ms FROM pending_submission WHERE user_id=? AND expires_at_ms>?;", {user_id, now_ms},
        [&](const Statement& st) {
          out = model::PendingSubmissionRecord{st.Int64(0), static_cast<uint64_t>(st.Int64(1)), static_cast<uint64_t>(st.Int64(2))};
        });
  return out;
}

Result SqliteRepository::DeletePendingSubmission(Transaction& t, int64_t user_id) {
  return Execute(TX(t).Handle(), "DELETE FROM pending_submission WHERE user_id=?;", {user_id});
}

// ------------------------------------------------------------------
// Engagement
// ------------------------------------------------------------------

Result SqliteRepository::IncrementView(Transaction& t, const std::string& token, const std::optional<std::string>& viewer_fingerprint,
                                       model::ViewCountRecord& counts) {
  auto* db = TX(t).Handle();
  if (auto r = Execute(db, "INSERT INTO view_counter(token,total) VALUES(?,1) ON CONFLICT(token) DO UPDATE SET total=total+1;", {token}); !r) {
    return r;
  }
  if (viewer_fingerprint && !viewer_fingerprint->empty()) {
    if (auto r = Execute(db, "INSERT OR IGNORE INTO view_viewer(token,fingerprint) VALUES(?,?);", {token, *viewer_fingerprint}); !r) {
      return r;
    }
  }
  counts = GetViews(t, token);
  return Result::Ok();
}

model::ViewCountRecord SqliteRepository::GetViews(Transaction& t, const std::string& token) {
  model::ViewCountRecord counts;
  Query(TX(t).Handle(),
        "SELECT COALESCE((SELECT total FROM view_counter WHERE token=?),0), (SELECT COUNT(*) FROM view_viewer WHERE token=?);", {token, token},
        [&](const Statement& st) {
          counts.total          = static_cast<uint64_t>(st.Int64(0));
          counts.unique_viewers = static_cast<uint64_t>(st.Int64(1));
        });
  return counts;
}

Result SqliteRepository::SetReaction(Transaction& t, const std::string& token, int64_t user_id, streamgate::v1::Reaction reaction) {
  if (reaction == streamgate::v1::REACTION_NONE) {
    return Execute(TX(t).Handle(), "DELETE FROM reaction WHERE token=? AND user_id=?;", {token, user_id});
  }
  return Execute(TX(t).Handle(),
                 "INSERT INTO reaction(token,user_id,choice) VALUES(?,?,?) ON CONFLICT(token,user_id) DO UPDATE SET choice=excluded.choice;",
                 {token, user_id, int64_t{reaction}});
}

model::ReactionCountRecord SqliteRepository::GetReactions(Transaction& t, const std::string& token, int64_t user_id) {
  model::ReactionCountRecord counts;
  Query(TX(t).Handle(),
        "SELECT COALESCE(SUM(CASE WHEN choice=? THEN 1 ELSE 0 END),0), COALESCE(SUM(CASE WHEN choice=? THEN 1 ELSE 0 END),0), "
        "COALESCE(MAX(CASE WHEN user_id=? THEN choice ELSE 0 END),0) FROM reaction WHERE token=?;",
        {int64_t{streamgate::v1::REACTION_LIKE}, int64_t{streamgate::v1::REACTION_DISLIKE}, user_id, token}, [&](const Statement& st) {
          counts.likes    = static_cast<uint64_t>(st.Int64(0));
          counts.dislikes = static_cast<uint64_t>(st.Int64(1));
          counts.current  = static_cast<streamgate::v1::Reaction>(st.Int64(2));
        });
  return counts;
}

// ------------------------------------------------------------------
// Premium users
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPremiumUser(Transaction& t, const model::PremiumUserRecord& r) {
  return Execute(TX(t).Handle(),
                 "INSERT INTO premium_user(user_id,expires_at_ms) VALUES(?,?) ON CONFLICT(user_id) DO UPDATE SET expires_at_ms=excluded.expires_at_ms;",
                 {r.user_id, r.expires_at_ms ? Param{*r.expires_at_ms} : Param{nullptr}});
}

Result SqliteRepository::DeletePremiumUser(Transaction& t, int64_t user_id) {
  uint64_t changes = 0;
  auto     result  = Execute(TX(t).Handle(), "DELETE FROM premium_user WHERE user_id=?;", {user_id}, &changes);
  if (result && changes == 0) return Result::Err(ErrorCode::NotFound, "premium user not found");
  return result;
}

std::optional<model::PremiumUserRecord> SqliteRepository::GetPremiumUser(Transaction& t, int64_t user_id) {
  std::optional<model::PremiumUserRecord> out;
  Query(TX(t).Handle(), "SELECT user_id,expires_at_ms FROM premium_user WHERE user_id=?;", {user_id}, [&](const Statement& st) {
    model::PremiumUserRecord r;
    r.user_id = st.Int64(0);
    if (!st.IsNull(1)) r.expires_at_ms = static_cast<uint64_t>(st.Int64(1));
    out = r;
  });
  return out;
}

std::vector<model::PremiumUserRecord> SqliteRepository::ListPremiumUsers(Transaction& t) {
  std::vector<model::PremiumUserRecord> out;
  Query(TX(t).Handle(), "SELECT user_id,expires_at_ms FROM premium_user ORDER BY user_id;", {}, [&](const Statement& st) {
    model::PremiumUserRecord r;
    r.user_id = st.Int64(0);
    if (!st.IsNull(1)) r.expires_at_ms = static_cast<uint64_t>(st.Int64(1));
    out.push_back(r);
  });
  return out;
}

} // namespace streamgate::db::sqlite
