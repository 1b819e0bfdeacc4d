#include "stream_handler.hpp"

#include <stdexcept>

#include "internal/core/stream_orchestrator.hpp"
#include "internal/observability/logging.hpp"

namespace streamgate::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

namespace {

constexpr std::string_view kStreamPrefix = "/stream/";

std::string_view ToStd(beast::string_view s) {
  return {s.data(), s.size()};
}

StreamHandler::Reply ErrorReply(const StreamHandler::Request& req, unsigned status, const streamgate::core::HeaderList& headers,
                                std::string_view reason) {
  StreamHandler::Reply reply;
  auto&                res = reply.message;
  res.result(static_cast<bhttp::status>(status));
  res.version(req.version());
  res.set(bhttp::field::server, "streamgate");
  res.set(bhttp::field::content_type, "text/plain");
  for (const auto& [name, value] : headers) {
    res.set(name, value);
  }
  res.keep_alive(req.keep_alive());
  if (req.method() != bhttp::verb::head) {
    res.body() = std::string(reason) + "\n";
  }
  res.prepare_payload();
  return reply;
}

} // namespace

StreamHandler::StreamHandler(std::shared_ptr<streamgate::core::StreamOrchestrator> orchestrator) : orchestrator_(std::move(orchestrator)) {
  if (!orchestrator_) {
    throw std::invalid_argument("StreamHandler: orchestrator is required");
  }
}

std::optional<std::string> StreamHandler::TokenFromTarget(std::string_view target) {
  const auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }
  if (target.substr(0, kStreamPrefix.size()) != kStreamPrefix) {
    return std::nullopt;
  }
  auto token = target.substr(kStreamPrefix.size());
  if (token.empty() || token.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(token);
}

StreamHandler::Reply StreamHandler::Handle(const Request& req) {
  try {
    return Dispatch(req);
  } catch (const std::exception& e) {
    STREAMGATE_LOG_ERROR("stream request failed", {observability::StringField("target", ToStd(req.target())),
                                                   observability::StringField("error", e.what())});
    auto reply = ErrorReply(req, 500, {}, "internal error");
    reply.message.keep_alive(false);
    return reply;
  }
}

StreamHandler::Reply StreamHandler::Dispatch(const Request& req) {
  if (req.method() != bhttp::verb::get && req.method() != bhttp::verb::head) {
    return ErrorReply(req, 405, {{"Allow", "GET, HEAD"}}, "method not allowed");
  }

  const auto token = TokenFromTarget(ToStd(req.target()));
  if (!token) {
    return ErrorReply(req, 404, {}, "not found");
  }

  std::optional<std::string_view> range_header;
  if (auto it = req.find(bhttp::field::range); it != req.end()) {
    range_header = ToStd(it->value());
  }

  const bool with_body = req.method() == bhttp::verb::get;
  auto       result    = orchestrator_->OpenStream(*token, range_header, with_body);

  if (result.error) {
    auto headers = result.headers;
    if (result.retry_after) {
      headers.emplace_back("Retry-After", std::to_string(result.retry_after->count()));
    }
    auto reply  = ErrorReply(req, result.status, headers, util::ToString(*result.error));
    reply.token = *token;
    return reply;
  }

  Reply reply;
  reply.token       = *token;
  reply.header_only = true;
  auto& res         = reply.message;
  res.result(static_cast<bhttp::status>(result.status));
  res.version(req.version());
  res.set(bhttp::field::server, "streamgate");
  bool has_length = false;
  for (const auto& [name, value] : result.headers) {
    res.set(name, value);
    has_length = has_length || beast::iequals(name, "Content-Length");
  }

  if (!with_body) {
    res.keep_alive(req.keep_alive());
    return reply;
  }

  // A streamed body always ends the connection.
  res.keep_alive(false);
  if (!has_length) {
    res.chunked(true);
  }
  reply.body = std::move(result.body);
  return reply;
}

} // namespace streamgate::http
