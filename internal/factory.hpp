#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace streamgate::db {
class Repository;
}
namespace streamgate::core {
class TokenStore;
class StreamOrchestrator;
} // namespace streamgate::core
namespace streamgate::origin {
class MediaOrigin;
}
namespace streamgate::http {
class HttpServer;
}
namespace streamgate::expiry {
class ExpiryWorker;
}

namespace streamgate::factory {

/*
  Application

  Owns all long-lived components used by the server. Nothing is started
  here; the caller starts the HTTP server, the expiry worker and the gRPC
  server built from grpc_services.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<core::TokenStore>         store;
  std::shared_ptr<core::StreamOrchestrator> orchestrator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::unique_ptr<http::HttpServer>     http_server;
  std::shared_ptr<expiry::ExpiryWorker> expiry_worker;
};

/*
  Composition root. The ONLY place allowed to know concrete DB and origin
  types.
*/
Application Build(const streamgate::runtime::config::RuntimeConfig& config);

// Same, with an injected media origin.
Application Build(const streamgate::runtime::config::RuntimeConfig& config, std::shared_ptr<origin::MediaOrigin> media_origin);

// Opens the configured backend and bootstraps its schema.
std::shared_ptr<db::Repository> BuildRepository(const streamgate::runtime::config::RuntimeConfig& config);

} // namespace streamgate::factory
