#pragma once

#include "service_context.hpp"
#include "streamgate/v1/catalog_service.pb.h"

namespace streamgate::service {

class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  streamgate::v1::PutReferenceResponse PutReference(const streamgate::v1::PutReferenceRequest& req);
  streamgate::v1::IngestResponse       Ingest(const streamgate::v1::IngestRequest& req);
  streamgate::v1::GetReferenceResponse GetReference(const streamgate::v1::GetReferenceRequest& req);

  streamgate::v1::TokenList ListRecent(const streamgate::v1::ListRecentRequest& req);
  streamgate::v1::TokenList ListSection(const streamgate::v1::ListSectionRequest& req);

  streamgate::v1::ViewCounts     IncrementView(const streamgate::v1::IncrementViewRequest& req);
  streamgate::v1::ReactionCounts SetReaction(const streamgate::v1::SetReactionRequest& req);
  streamgate::v1::ReactionCounts GetReactions(const streamgate::v1::GetReactionsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamgate::service
