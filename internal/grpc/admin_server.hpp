#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "streamgate/v1/admin_service.grpc.pb.h"

namespace streamgate::grpc {

class AdminServer final : public streamgate::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<streamgate::service::AdminService> svc);

  ::grpc::Status CreateSection(::grpc::ServerContext*, const streamgate::v1::CreateSectionRequest*, streamgate::v1::SectionResponse*) override;
  ::grpc::Status DeleteSection(::grpc::ServerContext*, const streamgate::v1::DeleteSectionRequest*, streamgate::v1::DeleteSectionResponse*) override;
  ::grpc::Status ListSections(::grpc::ServerContext*, const streamgate::v1::ListSectionsRequest*, streamgate::v1::ListSectionsResponse*) override;
  ::grpc::Status SetCurrentSection(::grpc::ServerContext*, const streamgate::v1::SetCurrentSectionRequest*, streamgate::v1::SectionResponse*) override;
  ::grpc::Status ClearCurrentSection(::grpc::ServerContext*, const streamgate::v1::ClearCurrentSectionRequest*, streamgate::v1::ClearCurrentSectionResponse*) override;
  ::grpc::Status GetCurrentSection(::grpc::ServerContext*, const streamgate::v1::GetCurrentSectionRequest*, streamgate::v1::SectionResponse*) override;
  ::grpc::Status PurgeExpired(::grpc::ServerContext*, const streamgate::v1::PurgeExpiredRequest*, streamgate::v1::PurgeExpiredResponse*) override;

 private:
  std::shared_ptr<streamgate::service::AdminService> service_;
};

} // namespace streamgate::grpc
