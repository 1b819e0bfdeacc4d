#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

#if STREAMGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STREAMGATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using streamgate::db::ErrorCode;
using streamgate::db::Repository;
using streamgate::db::memory::MemoryRepository;
using streamgate::db::model::PaymentRecord;
using streamgate::db::model::PendingSubmissionRecord;
using streamgate::db::model::PremiumUserRecord;
using streamgate::db::model::ReferenceRecord;
using streamgate::db::model::SectionRecord;
using streamgate::db::model::ViewCountRecord;
using namespace streamgate::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Postgres runs share one database across runs; keep every key unique.
struct Keys {
  std::string prefix;
  int64_t     user_base;

  std::string Token(const std::string& name) const {
    return prefix + "-" + name;
  }
  int64_t User(int64_t n) const {
    return user_base + n;
  }
};

ReferenceRecord MakeReference(const std::string& token, uint64_t expires_at_ms) {
  ReferenceRecord record;
  record.token = token;
  record.reference.mutable_primary_locator()->set_chat_id(-100123);
  record.reference.mutable_primary_locator()->set_message_id(77);
  record.reference.set_fallback_locator("locator-" + token);
  record.reference.set_mime_type("video/mp4");
  record.reference.set_size_bytes(4096);
  record.reference.set_access_tier(ACCESS_TIER_NORMAL);
  record.expires_at_ms = expires_at_ms;
  return record;
}

void VerifyReferences(Repository& repo, const Keys& keys) {
  const auto now = NowMs();
  auto       tx  = repo.Begin();

  auto live    = MakeReference(keys.Token("live"), now + 60'000);
  auto forever = MakeReference(keys.Token("forever"), 0);
  auto stale   = MakeReference(keys.Token("stale"), now - 1);
  assert(repo.UpsertReference(*tx, live));
  assert(repo.UpsertReference(*tx, forever));
  assert(repo.UpsertReference(*tx, stale));

  auto read = repo.GetReference(*tx, live.token, now);
  assert(read.has_value());
  assert(read->expires_at_ms == live.expires_at_ms);
  assert(read->reference.primary_locator().chat_id() == -100123);
  assert(read->reference.primary_locator().message_id() == 77);
  assert(read->reference.fallback_locator() == "locator-" + live.token);
  assert(read->reference.mime_type() == "video/mp4");
  assert(read->reference.size_bytes() == 4096);

  assert(repo.GetReference(*tx, forever.token, now + 10'000'000).has_value());
  assert(!repo.GetReference(*tx, stale.token, now).has_value());
  assert(!repo.GetReference(*tx, live.token, live.expires_at_ms).has_value());

  // Upsert replaces the whole row.
  live.reference.set_mime_type("audio/mpeg");
  live.reference.clear_size_bytes();
  assert(repo.UpsertReference(*tx, live));
  read = repo.GetReference(*tx, live.token, now);
  assert(read.has_value());
  assert(read->reference.mime_type() == "audio/mpeg");
  assert(!read->reference.has_size_bytes());

  tx->Commit();

  auto sweep = repo.Begin();
  assert(repo.UpsertReference(*sweep, MakeReference(keys.Token("sweep"), now + 5)));
  uint64_t deleted = 0;
  assert(repo.DeleteExpiredReferences(*sweep, now + 10, deleted));
  assert(deleted >= 1);
  assert(!repo.GetReference(*sweep, keys.Token("sweep"), 0).has_value());
  assert(repo.GetReference(*sweep, forever.token, now + 10).has_value());
  sweep->Commit();
}

void VerifyHistory(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin();
  for (int i = 0; i < 5; ++i) {
    assert(repo.AppendHistory(*tx, keys.Token("h" + std::to_string(i)), 3));
  }
  auto recent = repo.ListHistory(*tx, 10);
  assert(recent.size() == 3);
  assert(recent[0] == keys.Token("h4"));
  assert(recent[1] == keys.Token("h3"));
  assert(recent[2] == keys.Token("h2"));

  // Re-appending moves an existing entry to the front without duplicating it.
  assert(repo.AppendHistory(*tx, keys.Token("h2"), 3));
  recent = repo.ListHistory(*tx, 10);
  assert(recent.size() == 3);
  assert(recent[0] == keys.Token("h2"));
  assert(recent[1] == keys.Token("h4"));

  assert(repo.ListHistory(*tx, 1).size() == 1);
  tx->Commit();
}

void VerifySections(Repository& repo, const Keys& keys) {
  const auto id   = keys.prefix + "-weekend";
  const auto name = keys.prefix + " weekend";

  {
    auto tx = repo.Begin();
    assert(repo.InsertSection(*tx, SectionRecord{.id = id, .name = name, .created_at_ms = NowMs()}));

    auto same_id = repo.InsertSection(*tx, SectionRecord{.id = id, .name = name + " two", .created_at_ms = NowMs()});
    assert(same_id.Is(ErrorCode::AlreadyExists));
    auto same_name = repo.InsertSection(*tx, SectionRecord{.id = id + "-two", .name = name, .created_at_ms = NowMs()});
    assert(same_name.Is(ErrorCode::AlreadyExists));

    assert(repo.AppendSectionMember(*tx, id, keys.Token("a"), 2));
    assert(repo.AppendSectionMember(*tx, id, keys.Token("b"), 2));
    assert(repo.AppendSectionMember(*tx, id, keys.Token("c"), 2));
    assert(repo.AppendSectionMember(*tx, id + "-missing", keys.Token("a"), 2).Is(ErrorCode::NotFound));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto by_name = repo.GetSectionByName(*tx, name);
    assert(by_name.has_value());
    assert(by_name->id == id);
    assert(by_name->member_count == 2);

    auto members = repo.ListSectionMembers(*tx, id, 10);
    assert(members.size() == 2);
    assert(members[0] == keys.Token("c"));
    assert(members[1] == keys.Token("b"));

    bool listed = false;
    for (const auto& section : repo.ListSections(*tx)) {
      if (section.id == id) listed = true;
    }
    assert(listed);

    assert(repo.DeleteSection(*tx, id));
    assert(repo.DeleteSection(*tx, id).Is(ErrorCode::NotFound));
    assert(!repo.GetSectionById(*tx, id).has_value());
    assert(!repo.GetSectionByName(*tx, name).has_value());
    assert(repo.ListSectionMembers(*tx, id, 10).empty());

    // The name is free again once the section is gone.
    assert(repo.InsertSection(*tx, SectionRecord{.id = id, .name = name, .created_at_ms = NowMs()}));
    assert(repo.GetSectionById(*tx, id)->member_count == 0);
    tx->Commit();
  }
}

void VerifySettings(Repository& repo, const Keys& keys) {
  auto tx  = repo.Begin();
  auto key = keys.prefix + ".current_section";
  assert(!repo.GetSetting(*tx, key).has_value());
  assert(repo.PutSetting(*tx, key, "one"));
  assert(repo.PutSetting(*tx, key, "two"));
  assert(repo.GetSetting(*tx, key) == std::optional<std::string>("two"));
  tx->Commit();
}

void VerifyCredits(Repository& repo, const Keys& keys) {
  const auto user = keys.User(1);
  auto       tx   = repo.Begin();

  assert(repo.GetCredits(*tx, user) == 0);

  int64_t balance = -1;
  assert(repo.AddCredits(*tx, user, 5, balance));
  assert(balance == 5);
  assert(repo.AddCredits(*tx, user, 3, balance));
  assert(balance == 8);

  assert(repo.ChargeCredits(*tx, user, 6, balance));
  assert(balance == 2);

  auto over = repo.ChargeCredits(*tx, user, 3, balance);
  assert(over.Is(ErrorCode::Conflict));
  assert(balance == 2);
  assert(repo.GetCredits(*tx, user) == 2);

  auto empty = repo.ChargeCredits(*tx, keys.User(2), 1, balance);
  assert(empty.Is(ErrorCode::Conflict));
  assert(balance == 0);

  assert(repo.AddCredits(*tx, keys.User(3), 1'000'000, balance));
  auto top = repo.ListCreditBalances(*tx, 1);
  assert(top.size() == 1);
  assert(top[0].balance >= 1'000'000);
  tx->Commit();
}

void VerifyConcurrentCharges(Repository& repo, const Keys& keys) {
  const auto user = keys.User(10);
  {
    auto    tx      = repo.Begin();
    int64_t balance = 0;
    assert(repo.AddCredits(*tx, user, 25, balance));
    tx->Commit();
  }

  std::atomic<int>         charged{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 10; ++i) {
        auto    tx      = repo.Begin();
        int64_t balance = 0;
        if (repo.ChargeCredits(*tx, user, 1, balance)) {
          tx->Commit();
          ++charged;
        } else {
          tx->Rollback();
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(charged.load() == 25);
  auto tx = repo.Begin();
  assert(repo.GetCredits(*tx, user) == 0);
  tx->Commit();
}

void VerifyPayments(Repository& repo, const Keys& keys) {
  const auto user = keys.User(20);
  auto       tx   = repo.Begin();

  PaymentRecord first{.user_id = user, .amount_minor = 3500, .credits = 2, .created_at_ms = NowMs(), .updated_at_ms = NowMs()};
  PaymentRecord second{.user_id = user, .amount_minor = 1000, .credits = 1, .created_at_ms = NowMs(), .updated_at_ms = NowMs()};
  assert(repo.InsertPayment(*tx, first));
  assert(repo.InsertPayment(*tx, second));
  assert(first.id != 0);
  assert(second.id > first.id);

  auto read = repo.GetPayment(*tx, first.id);
  assert(read.has_value());
  assert(read->user_id == user);
  assert(read->status == PAYMENT_STATUS_PENDING);
  assert(read->amount_minor == 3500);

  auto submitted   = *read;
  submitted.status = PAYMENT_STATUS_SUBMITTED;
  submitted.note   = "ref 0042";
  assert(repo.CompareAndSetPayment(*tx, submitted, PAYMENT_STATUS_PENDING));

  // The stored status moved on, so a second writer expecting PENDING loses.
  auto stale   = *read;
  stale.status = PAYMENT_STATUS_REJECTED;
  assert(repo.CompareAndSetPayment(*tx, stale, PAYMENT_STATUS_PENDING).Is(ErrorCode::Conflict));

  auto approved       = submitted;
  approved.status     = PAYMENT_STATUS_APPROVED;
  approved.handled_by = keys.User(99);
  assert(repo.CompareAndSetPayment(*tx, approved, PAYMENT_STATUS_SUBMITTED));

  PaymentRecord missing = approved;
  missing.id            = second.id + 1'000'000;
  assert(repo.CompareAndSetPayment(*tx, missing, PAYMENT_STATUS_APPROVED).Is(ErrorCode::NotFound));

  read = repo.GetPayment(*tx, first.id);
  assert(read->status == PAYMENT_STATUS_APPROVED);
  assert(read->note == "ref 0042");
  assert(read->handled_by == keys.User(99));

  auto newest = repo.ListPayments(*tx, std::nullopt, 2);
  assert(newest.size() == 2);
  assert(newest[0].id == second.id);
  assert(newest[1].id == first.id);

  for (const auto& p : repo.ListPayments(*tx, PAYMENT_STATUS_APPROVED, 1000)) {
    assert(p.status == PAYMENT_STATUS_APPROVED);
  }
  bool pending_listed = false;
  for (const auto& p : repo.ListPayments(*tx, PAYMENT_STATUS_PENDING, 1000)) {
    assert(p.status == PAYMENT_STATUS_PENDING);
    if (p.id == second.id) pending_listed = true;
  }
  assert(pending_listed);

  const auto now = NowMs();
  assert(repo.PutPendingSubmission(*tx, PendingSubmissionRecord{.user_id = user, .request_id = second.id, .expires_at_ms = now + 1000}));
  auto pending = repo.GetPendingSubmission(*tx, user, now);
  assert(pending.has_value());
  assert(pending->request_id == second.id);
  assert(!repo.GetPendingSubmission(*tx, user, now + 1000).has_value());
  assert(repo.DeletePendingSubmission(*tx, user));
  assert(!repo.GetPendingSubmission(*tx, user, now).has_value());

  tx->Commit();
}

void VerifyEngagement(Repository& repo, const Keys& keys) {
  const auto token = keys.Token("watched");
  auto       tx    = repo.Begin();

  ViewCountRecord counts;
  assert(repo.IncrementView(*tx, token, std::string("viewer-a"), counts));
  assert(repo.IncrementView(*tx, token, std::string("viewer-a"), counts));
  assert(repo.IncrementView(*tx, token, std::string("viewer-b"), counts));
  assert(repo.IncrementView(*tx, token, std::nullopt, counts));
  assert(counts.total == 4);
  assert(counts.unique_viewers == 2);

  auto views = repo.GetViews(*tx, token);
  assert(views.total == 4);
  assert(views.unique_viewers == 2);
  assert(repo.GetViews(*tx, keys.Token("unwatched")).total == 0);

  assert(repo.SetReaction(*tx, token, keys.User(1), REACTION_LIKE));
  assert(repo.SetReaction(*tx, token, keys.User(2), REACTION_LIKE));
  assert(repo.SetReaction(*tx, token, keys.User(3), REACTION_DISLIKE));
  assert(repo.SetReaction(*tx, token, keys.User(2), REACTION_DISLIKE));

  auto reactions = repo.GetReactions(*tx, token, keys.User(2));
  assert(reactions.likes == 1);
  assert(reactions.dislikes == 2);
  assert(reactions.current == REACTION_DISLIKE);

  assert(repo.SetReaction(*tx, token, keys.User(2), REACTION_NONE));
  reactions = repo.GetReactions(*tx, token, keys.User(2));
  assert(reactions.dislikes == 1);
  assert(reactions.current == REACTION_NONE);

  tx->Commit();
}

void VerifyPremiumUsers(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin();

  assert(repo.UpsertPremiumUser(*tx, PremiumUserRecord{.user_id = keys.User(30)}));
  assert(repo.UpsertPremiumUser(*tx, PremiumUserRecord{.user_id = keys.User(31), .expires_at_ms = NowMs() + 86'400'000}));

  auto lifetime = repo.GetPremiumUser(*tx, keys.User(30));
  assert(lifetime.has_value());
  assert(!lifetime->expires_at_ms.has_value());

  auto timed = repo.GetPremiumUser(*tx, keys.User(31));
  assert(timed.has_value());
  assert(timed->expires_at_ms.has_value());

  // Upsert turns a timed grant into a lifetime one.
  assert(repo.UpsertPremiumUser(*tx, PremiumUserRecord{.user_id = keys.User(31)}));
  assert(!repo.GetPremiumUser(*tx, keys.User(31))->expires_at_ms.has_value());

  int listed = 0;
  for (const auto& user : repo.ListPremiumUsers(*tx)) {
    if (user.user_id == keys.User(30) || user.user_id == keys.User(31)) ++listed;
  }
  assert(listed == 2);

  assert(repo.DeletePremiumUser(*tx, keys.User(30)));
  assert(repo.DeletePremiumUser(*tx, keys.User(30)).Is(ErrorCode::NotFound));
  assert(!repo.GetPremiumUser(*tx, keys.User(30)).has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Keys& keys) {
  const auto token = keys.Token("rolled-back");
  {
    auto    tx = repo.Begin();
    int64_t balance = 0;
    assert(repo.UpsertReference(*tx, MakeReference(token, 0)));
    assert(repo.AddCredits(*tx, keys.User(40), 9, balance));
    assert(repo.InsertSection(*tx, SectionRecord{.id = token, .name = token, .created_at_ms = NowMs()}));
    tx->Rollback();
  }
  {
    // Destroyed without Commit() behaves like Rollback().
    auto tx = repo.Begin();
    assert(repo.PutSetting(*tx, token, "x"));
  }

  const auto      viewed = keys.Token("viewed-then-rolled-back");
  ViewCountRecord counts;
  {
    auto tx = repo.Begin();
    assert(repo.IncrementView(*tx, viewed, std::string("viewer-a"), counts));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.IncrementView(*tx, viewed, std::string("viewer-a"), counts));
    assert(repo.IncrementView(*tx, viewed, std::string("viewer-b"), counts));
    assert(repo.IncrementView(*tx, keys.Token("never-viewed"), std::string("viewer-c"), counts));
    assert(counts.unique_viewers == 1);
    assert(repo.GetViews(*tx, viewed).unique_viewers == 2);
    tx->Rollback();
  }

  auto check = repo.Begin();
  assert(repo.GetViews(*check, viewed).total == 1);
  assert(repo.GetViews(*check, viewed).unique_viewers == 1);
  assert(repo.GetViews(*check, keys.Token("never-viewed")).total == 0);
  assert(repo.GetViews(*check, keys.Token("never-viewed")).unique_viewers == 0);
  assert(!repo.GetReference(*check, token, NowMs()).has_value());
  assert(repo.GetCredits(*check, keys.User(40)) == 0);
  assert(!repo.GetSectionById(*check, token).has_value());
  assert(!repo.GetSetting(*check, token).has_value());
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const Keys& keys) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto    tx      = repo->Begin();
    int64_t balance = 0;
    assert(repo->UpsertReference(*tx, MakeReference(keys.Token("durable"), 0)));
    assert(repo->AddCredits(*tx, keys.User(50), 11, balance));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetReference(*tx, keys.Token("durable"), NowMs());
  assert(r.has_value());
  assert(r->reference.fallback_locator() == "locator-" + keys.Token("durable"));
  assert(repo->GetCredits(*tx, keys.User(50)) == 11);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STREAMGATE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("streamgate_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<streamgate::db::sqlite::SqliteDB>(db_path);
    streamgate::db::sqlite::SqliteMigrationExecutor executor(*db);
    streamgate::db::sql::RunMigrations(executor, streamgate::db::sql::SqliteSchema());
    return std::make_shared<streamgate::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

#if STREAMGATE_DB_POSTGRES
std::optional<BackendFactory> MakePostgresFactory() {
  const char* uri = std::getenv("STREAMGATE_TEST_PG_URI");
  if (uri == nullptr || *uri == '\0') {
    return std::nullopt;
  }

  auto make_repo = [conninfo = std::string(uri)]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<streamgate::db::postgres::PgPool>(conninfo, 8);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      streamgate::db::postgres::PgMigrationExecutor executor(tx);
      streamgate::db::sql::RunMigrations(executor, streamgate::db::sql::PostgresSchema());
      tx.commit();
    }
    return std::make_shared<streamgate::db::postgres::PgRepository>(pool);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

void RunBackend(BackendFactory& backend) {
  const auto stamp = NowMs();
  const Keys keys{.prefix = "it-" + backend.name + "-" + std::to_string(stamp), .user_base = static_cast<int64_t>(stamp % 1'000'000'000) * 100};

  auto repo = backend.make_repository();
  VerifyReferences(*repo, keys);
  VerifyHistory(*repo, keys);
  VerifySections(*repo, keys);
  VerifySettings(*repo, keys);
  VerifyCredits(*repo, keys);
  VerifyConcurrentCharges(*repo, keys);
  VerifyPayments(*repo, keys);
  VerifyEngagement(*repo, keys);
  VerifyPremiumUsers(*repo, keys);
  VerifyRollbackBehavior(*repo, keys);
  repo.reset();

  VerifyRestartDurability(backend, keys);
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if STREAMGATE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if STREAMGATE_DB_POSTGRES
  if (auto pg = MakePostgresFactory()) {
    backends.push_back(std::move(*pg));
  }
#endif

  for (auto& backend : backends) {
    RunBackend(backend);
  }

  std::cout << "streamgate_integration_repository_parity: pass\n";
  return 0;
}
