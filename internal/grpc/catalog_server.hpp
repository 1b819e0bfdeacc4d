#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/catalog_service.hpp"
#include "streamgate/v1/catalog_service.grpc.pb.h"

namespace streamgate::grpc {

class CatalogServer final : public streamgate::v1::CatalogService::Service {
 public:
  explicit CatalogServer(std::shared_ptr<streamgate::service::CatalogService> svc);

  ::grpc::Status PutReference(::grpc::ServerContext*, const streamgate::v1::PutReferenceRequest*, streamgate::v1::PutReferenceResponse*) override;
  ::grpc::Status Ingest(::grpc::ServerContext*, const streamgate::v1::IngestRequest*, streamgate::v1::IngestResponse*) override;
  ::grpc::Status GetReference(::grpc::ServerContext*, const streamgate::v1::GetReferenceRequest*, streamgate::v1::GetReferenceResponse*) override;
  ::grpc::Status ListRecent(::grpc::ServerContext*, const streamgate::v1::ListRecentRequest*, streamgate::v1::TokenList*) override;
  ::grpc::Status ListSection(::grpc::ServerContext*, const streamgate::v1::ListSectionRequest*, streamgate::v1::TokenList*) override;
  ::grpc::Status IncrementView(::grpc::ServerContext*, const streamgate::v1::IncrementViewRequest*, streamgate::v1::ViewCounts*) override;
  ::grpc::Status SetReaction(::grpc::ServerContext*, const streamgate::v1::SetReactionRequest*, streamgate::v1::ReactionCounts*) override;
  ::grpc::Status GetReactions(::grpc::ServerContext*, const streamgate::v1::GetReactionsRequest*, streamgate::v1::ReactionCounts*) override;

 private:
  std::shared_ptr<streamgate::service::CatalogService> service_;
};

} // namespace streamgate::grpc
