#include "admin_service.hpp"

#include "internal/core/token_store.hpp"
#include "internal/service/rpc_support.hpp"

namespace streamgate::service {

using namespace streamgate::v1;

namespace {

SectionResponse ToResponse(const core::SectionOutcome& outcome) {
  SectionResponse resp;
  resp.set_outcome(ToOutcome(outcome.error));
  *resp.mutable_section() = outcome.section;
  return resp;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SectionResponse AdminService::CreateSection(const CreateSectionRequest& req) {
  return ObserveRpc("AdminService.CreateSection", [&] {
    auto created = ctx_.store->CreateSection(req.name());
    if (!created.error && req.make_current()) {
      return ToResponse(ctx_.store->SetCurrentSection(created.section.id()));
    }
    return ToResponse(created);
  });
}

DeleteSectionResponse AdminService::DeleteSection(const DeleteSectionRequest& req) {
  return ObserveRpc("AdminService.DeleteSection", [&] {
    DeleteSectionResponse resp;
    resp.set_deleted(ctx_.store->DeleteSection(req.section()));
    return resp;
  });
}

ListSectionsResponse AdminService::ListSections(const ListSectionsRequest&) {
  return ObserveRpc("AdminService.ListSections", [&] {
    ListSectionsResponse resp;
    for (auto& section : ctx_.store->ListSections()) {
      *resp.add_sections() = std::move(section);
    }
    return resp;
  });
}

SectionResponse AdminService::SetCurrentSection(const SetCurrentSectionRequest& req) {
  return ObserveRpc("AdminService.SetCurrentSection", [&] { return ToResponse(ctx_.store->SetCurrentSection(req.section())); });
}

ClearCurrentSectionResponse AdminService::ClearCurrentSection(const ClearCurrentSectionRequest&) {
  return ObserveRpc("AdminService.ClearCurrentSection", [&] {
    ctx_.store->ClearCurrentSection();
    return ClearCurrentSectionResponse{};
  });
}

SectionResponse AdminService::GetCurrentSection(const GetCurrentSectionRequest&) {
  return ObserveRpc("AdminService.GetCurrentSection", [&] {
    SectionResponse resp;
    auto            current = ctx_.store->CurrentSection();
    if (!current) {
      resp.set_outcome(OUTCOME_NOT_FOUND);
      return resp;
    }
    resp.set_outcome(OUTCOME_OK);
    *resp.mutable_section() = std::move(*current);
    return resp;
  });
}

PurgeExpiredResponse AdminService::PurgeExpired(const PurgeExpiredRequest&) {
  return ObserveRpc("AdminService.PurgeExpired", [&] {
    PurgeExpiredResponse resp;
    resp.set_removed(ctx_.store->PurgeExpired());
    return resp;
  });
}

} // namespace streamgate::service
