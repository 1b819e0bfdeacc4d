#include "catalog_server.hpp"

#include "grpc_error.hpp"

namespace streamgate::grpc {

using namespace streamgate::v1;

CatalogServer::CatalogServer(std::shared_ptr<streamgate::service::CatalogService> svc) : service_(std::move(svc)) {
}

::grpc::Status CatalogServer::PutReference(::grpc::ServerContext*, const PutReferenceRequest* req, PutReferenceResponse* resp) {
  try {
    *resp = service_->PutReference(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::Ingest(::grpc::ServerContext*, const IngestRequest* req, IngestResponse* resp) {
  try {
    *resp = service_->Ingest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetReference(::grpc::ServerContext*, const GetReferenceRequest* req, GetReferenceResponse* resp) {
  try {
    *resp = service_->GetReference(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListRecent(::grpc::ServerContext*, const ListRecentRequest* req, TokenList* resp) {
  try {
    *resp = service_->ListRecent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListSection(::grpc::ServerContext*, const ListSectionRequest* req, TokenList* resp) {
  try {
    *resp = service_->ListSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::IncrementView(::grpc::ServerContext*, const IncrementViewRequest* req, ViewCounts* resp) {
  try {
    *resp = service_->IncrementView(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::SetReaction(::grpc::ServerContext*, const SetReactionRequest* req, ReactionCounts* resp) {
  try {
    *resp = service_->SetReaction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::GetReactions(::grpc::ServerContext*, const GetReactionsRequest* req, ReactionCounts* resp) {
  try {
    *resp = service_->GetReactions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamgate::grpc
