#pragma once

#include "service_context.hpp"
#include "streamgate/v1/admin_service.pb.h"

namespace streamgate::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  streamgate::v1::SectionResponse             CreateSection(const streamgate::v1::CreateSectionRequest& req);
  streamgate::v1::DeleteSectionResponse       DeleteSection(const streamgate::v1::DeleteSectionRequest& req);
  streamgate::v1::ListSectionsResponse        ListSections(const streamgate::v1::ListSectionsRequest& req);
  streamgate::v1::SectionResponse             SetCurrentSection(const streamgate::v1::SetCurrentSectionRequest& req);
  streamgate::v1::ClearCurrentSectionResponse ClearCurrentSection(const streamgate::v1::ClearCurrentSectionRequest& req);
  streamgate::v1::SectionResponse             GetCurrentSection(const streamgate::v1::GetCurrentSectionRequest& req);
  streamgate::v1::PurgeExpiredResponse        PurgeExpired(const streamgate::v1::PurgeExpiredRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamgate::service
