#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace streamgate::grpc {

using namespace streamgate::v1;

AdminServer::AdminServer(std::shared_ptr<streamgate::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::CreateSection(::grpc::ServerContext*, const CreateSectionRequest* req, SectionResponse* resp) {
  try {
    *resp = service_->CreateSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DeleteSection(::grpc::ServerContext*, const DeleteSectionRequest* req, DeleteSectionResponse* resp) {
  try {
    *resp = service_->DeleteSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListSections(::grpc::ServerContext*, const ListSectionsRequest* req, ListSectionsResponse* resp) {
  try {
    *resp = service_->ListSections(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SetCurrentSection(::grpc::ServerContext*, const SetCurrentSectionRequest* req, SectionResponse* resp) {
  try {
    *resp = service_->SetCurrentSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ClearCurrentSection(::grpc::ServerContext*, const ClearCurrentSectionRequest* req, ClearCurrentSectionResponse* resp) {
  try {
    *resp = service_->ClearCurrentSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetCurrentSection(::grpc::ServerContext*, const GetCurrentSectionRequest* req, SectionResponse* resp) {
  try {
    *resp = service_->GetCurrentSection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::PurgeExpired(::grpc::ServerContext*, const PurgeExpiredRequest* req, PurgeExpiredResponse* resp) {
  try {
    *resp = service_->PurgeExpired(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamgate::grpc
