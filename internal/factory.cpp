#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <stdexcept>

#include "internal/core/access_policy.hpp"
#include "internal/core/stream_orchestrator.hpp"
#include "internal/core/token_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/expiry/expiry_worker.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/http/http_server.hpp"
#include "internal/http/stream_handler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/origin/grpc_media_origin.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if STREAMGATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STREAMGATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace streamgate::factory {

using streamgate::runtime::config::RuntimeConfig;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
}

std::shared_ptr<origin::MediaOrigin> BuildOrigin(const RuntimeConfig& config) {
  const auto& origin = config.origin();
  auto        channel = ::grpc::CreateChannel(origin.target(), ::grpc::InsecureChannelCredentials());

  STREAMGATE_LOG_INFO("media origin configured", {observability::StringField("target", origin.target()),
                                                   observability::UintField("chunk_size", origin.chunk_size_bytes())});
  return std::make_shared<origin::GrpcMediaOrigin>(std::move(channel), origin.chunk_size_bytes(), ToMillis(origin.resolve_timeout()));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STREAMGATE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    {
      db::sqlite::SqliteMigrationExecutor executor(*sqlite_db);
      db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    }
    STREAMGATE_LOG_INFO("database backend selected", {observability::StringField("backend", "sqlite"),
                                                      observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if STREAMGATE_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      db::postgres::PgMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }
    STREAMGATE_LOG_INFO("database backend selected", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  STREAMGATE_LOG_INFO("database backend selected", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  return Build(config, BuildOrigin(config));
}

Application Build(const RuntimeConfig& config, std::shared_ptr<origin::MediaOrigin> media_origin) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  core::TokenStoreOptions store_options;
  store_options.history_limit                  = config.tokens().history_limit();
  store_options.default_ttl                    = util::FromProto(config.tokens().ttl());
  store_options.pending_submission_ttl         = util::FromProto(config.ledger().pending_submission_ttl());
  store_options.default_price_per_credit_minor = config.ledger().default_price_per_credit_minor();

  app.store   = std::make_shared<core::TokenStore>(app.repository, store_options);
  auto access = std::make_shared<core::AccessPolicy>(app.store, config.ledger().credit_cost());

  core::StreamOrchestrator::Options stream_options;
  stream_options.output_chunk_size       = config.http().output_chunk_size_bytes();
  stream_options.allow_premium_streaming = config.http().allow_premium_streaming();
  app.orchestrator = std::make_shared<core::StreamOrchestrator>(app.store, std::move(media_origin), stream_options);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  app.expiry_worker = std::make_shared<expiry::ExpiryWorker>(app.store, ToMillis(config.tokens().expiry_sweep_interval()));

  // ------------------------------------------------------------------
  // HTTP streaming endpoint
  // ------------------------------------------------------------------
  http::HttpServer::Options http_options;
  http_options.bind_address   = config.http().bind_address();
  http_options.port           = static_cast<uint16_t>(config.http().port());
  http_options.worker_threads = config.http().worker_threads();
  http_options.stream_threads = config.http().stream_threads();
  http_options.read_timeout   = ToMillis(config.http().read_timeout());
  app.http_server = std::make_unique<http::HttpServer>(http_options, std::make_shared<http::StreamHandler>(app.orchestrator));

  // ------------------------------------------------------------------
  // gRPC control plane
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store  = app.store;
  ctx.access = access;

  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(std::make_shared<service::CatalogService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(std::make_shared<service::LedgerService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));

  return app;
}

} // namespace streamgate::factory
