#include "catalog_service.hpp"

#include <optional>

#include "internal/core/token_store.hpp"
#include "internal/service/rpc_support.hpp"
#include "internal/util/time.hpp"

namespace streamgate::service {

using namespace streamgate::v1;

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PutReferenceResponse CatalogService::PutReference(const PutReferenceRequest& req) {
  return ObserveRpc("CatalogService.PutReference", [&] {
    if (!req.has_reference()) {
      throw util::InvalidArgument("reference is required");
    }
    std::optional<std::chrono::seconds> ttl;
    if (req.has_ttl()) ttl = util::FromProto(req.ttl());

    ctx_.store->Put(req.token(), req.reference(), ttl);
    return PutReferenceResponse{};
  });
}

IngestResponse CatalogService::Ingest(const IngestRequest& req) {
  return ObserveRpc("CatalogService.Ingest", [&] {
    if (!req.has_reference()) {
      throw util::InvalidArgument("reference is required");
    }
    std::optional<std::chrono::seconds> ttl;
    if (req.has_ttl()) ttl = util::FromProto(req.ttl());

    auto result = ctx_.store->Ingest(req.reference(), ttl, req.with_premium_alias());

    IngestResponse resp;
    resp.set_token(result.token);
    resp.set_premium_token(result.premium_token);
    *resp.mutable_reference() = std::move(result.reference);
    return resp;
  });
}

GetReferenceResponse CatalogService::GetReference(const GetReferenceRequest& req) {
  return ObserveRpc("CatalogService.GetReference", [&] {
    GetReferenceResponse resp;
    auto                 reference = ctx_.store->Get(req.token(), util::FromProto(req.grace()));
    if (!reference) {
      resp.set_outcome(OUTCOME_NOT_FOUND);
      return resp;
    }
    resp.set_outcome(OUTCOME_OK);
    *resp.mutable_reference() = std::move(*reference);
    return resp;
  });
}

TokenList CatalogService::ListRecent(const ListRecentRequest& req) {
  return ObserveRpc("CatalogService.ListRecent", [&] {
    TokenList resp;
    resp.set_outcome(OUTCOME_OK);
    for (auto& token : ctx_.store->ListRecent(req.limit())) {
      resp.add_tokens(std::move(token));
    }
    return resp;
  });
}

TokenList CatalogService::ListSection(const ListSectionRequest& req) {
  return ObserveRpc("CatalogService.ListSection", [&] {
    TokenList resp;
    auto      tokens = ctx_.store->ListSection(req.section(), req.limit());
    if (!tokens) {
      resp.set_outcome(OUTCOME_NOT_FOUND);
      return resp;
    }
    resp.set_outcome(OUTCOME_OK);
    for (auto& token : *tokens) {
      resp.add_tokens(std::move(token));
    }
    return resp;
  });
}

ViewCounts CatalogService::IncrementView(const IncrementViewRequest& req) {
  return ObserveRpc("CatalogService.IncrementView", [&] {
    std::optional<std::string> fingerprint;
    if (req.has_viewer_fingerprint()) fingerprint = req.viewer_fingerprint();
    return ctx_.store->IncrementView(req.token(), fingerprint);
  });
}

ReactionCounts CatalogService::SetReaction(const SetReactionRequest& req) {
  return ObserveRpc("CatalogService.SetReaction", [&] { return ctx_.store->SetReaction(req.token(), req.user_id(), req.reaction()); });
}

ReactionCounts CatalogService::GetReactions(const GetReactionsRequest& req) {
  return ObserveRpc("CatalogService.GetReactions", [&] { return ctx_.store->GetReactions(req.token(), req.user_id()); });
}

} // namespace streamgate::service
