#include "stream_orchestrator.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/range/range_planner.hpp"

namespace streamgate::core {

using namespace streamgate::v1;

namespace {

constexpr const char* kDefaultContentType = "application/octet-stream";

StreamResponse Fail(util::ErrorKind kind) {
  StreamResponse response;
  response.error  = kind;
  response.status = HttpStatusFor(kind);
  return response;
}

void LogOpen(const std::string& token, std::optional<std::string_view> range_header, const StreamResponse& response) {
  STREAMGATE_LOG_INFO("stream open", {observability::StringField("token", token), observability::StringField("range", range_header.value_or("-")),
                                      observability::UintField("status", response.status),
                                      observability::StringField("error", response.error ? util::ToString(*response.error) : "none")});
}

} // namespace

unsigned HttpStatusFor(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kNotFound:
      return 404;
    case util::ErrorKind::kRangeNotSatisfiable:
      return 416;
    case util::ErrorKind::kOriginUnavailable:
      return 503;
    case util::ErrorKind::kAccessDenied:
    case util::ErrorKind::kInsufficientBalance:
      return 403;
    default:
      return 500;
  }
}

StreamOrchestrator::StreamOrchestrator(std::shared_ptr<TokenStore> store, std::shared_ptr<origin::MediaOrigin> origin, Options options)
    : store_(std::move(store)), origin_(std::move(origin)), options_(options) {
  if (!store_ || !origin_) {
    throw std::invalid_argument("StreamOrchestrator: store and origin are required");
  }
  if (options_.output_chunk_size == 0) {
    throw std::invalid_argument("StreamOrchestrator: output chunk size must be non-zero");
  }
}

std::optional<std::string> StreamOrchestrator::ResolveLocator(const MediaReference& reference) {
  const auto& primary = reference.primary_locator();
  if (primary.message_id() != 0) {
    try {
      if (auto fresh = origin_->Resolve(primary.chat_id(), primary.message_id())) {
        return fresh;
      }
    } catch (const util::OriginUnavailable& e) {
      STREAMGATE_LOG_WARN("origin resolve unavailable, using stored locator", {observability::StringField("error", e.what())});
    }
  }
  if (!reference.fallback_locator().empty()) {
    return reference.fallback_locator();
  }
  return std::nullopt;
}

StreamResponse StreamOrchestrator::OpenStream(const std::string& token, std::optional<std::string_view> range_header, bool with_body) {
  auto reference = store_->Get(token);
  if (!reference) {
    auto response = Fail(util::ErrorKind::kNotFound);
    LogOpen(token, range_header, response);
    return response;
  }

  if (reference->access_tier() == ACCESS_TIER_PREMIUM && !options_.allow_premium_streaming) {
    auto response = Fail(util::ErrorKind::kAccessDenied);
    response.tier = reference->access_tier();
    LogOpen(token, range_header, response);
    return response;
  }

  const std::optional<uint64_t> total = reference->has_size_bytes() ? std::optional<uint64_t>(reference->size_bytes()) : std::nullopt;

  const auto planned = range::Plan(range_header, total);
  // A ranged request needs the total to build Content-Range.
  if (!planned || (range_header && !total)) {
    auto response = Fail(util::ErrorKind::kRangeNotSatisfiable);
    if (total) {
      response.headers.emplace_back("Content-Range", "bytes */" + std::to_string(*total));
    }
    LogOpen(token, range_header, response);
    return response;
  }

  const auto locator = ResolveLocator(*reference);
  if (!locator) {
    auto response = Fail(util::ErrorKind::kNotFound);
    LogOpen(token, range_header, response);
    return response;
  }

  StreamResponse response;
  response.tier = reference->access_tier();
  response.headers.emplace_back("Accept-Ranges", "bytes");
  response.headers.emplace_back("Content-Type",
                                reference->has_mime_type() && !reference->mime_type().empty() ? reference->mime_type() : kDefaultContentType);

  if (range_header) {
    const uint64_t length = planned->end ? *planned->end - planned->start + 1 : *total - planned->start;
    response.status       = 206;
    response.headers.emplace_back("Content-Range", "bytes " + std::to_string(planned->start) + "-" + std::to_string(planned->start + length - 1) + "/" +
                                                       std::to_string(*total));
    response.headers.emplace_back("Content-Length", std::to_string(length));
  } else if (total) {
    response.headers.emplace_back("Content-Length", std::to_string(*total));
  }

  if (!with_body) {
    LogOpen(token, range_header, response);
    return response;
  }

  // Bound the body by the known size even when the request was open ended.
  auto span = *planned;
  if (!span.end && total && *total > span.start) span.end = *total - 1;
  std::optional<uint64_t> body_length = span.Length();
  if (!body_length && total) body_length = 0;

  try {
    const auto window = streaming::PlanOriginWindow(span, origin_->ChunkSize());
    auto       source = origin_->OpenChunkedDownload(*locator, window.offset_bytes, window.limit_bytes);
    response.body     = std::make_unique<streaming::ChunkRemapper>(std::move(source), window.skip_bytes, body_length, options_.output_chunk_size);
    response.body->Prime();
  } catch (const util::OriginUnavailable& e) {
    const auto retry_after = e.retry_after();
    STREAMGATE_LOG_WARN("origin rate limited", {observability::StringField("token", token), observability::StringField("error", e.what()),
                                                observability::IntField("retry_after_s", retry_after ? retry_after->count() : 0)});
    auto failed        = Fail(util::ErrorKind::kOriginUnavailable);
    failed.tier        = response.tier;
    failed.retry_after = retry_after;
    LogOpen(token, range_header, failed);
    return failed;
  }

  LogOpen(token, range_header, response);
  return response;
}

} // namespace streamgate::core
