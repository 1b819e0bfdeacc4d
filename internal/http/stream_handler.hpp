#pragma once

#include <boost/beast/http.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/streaming/chunk_remapper.hpp"

namespace streamgate::core {
class StreamOrchestrator;
}

namespace streamgate::http {

/*
  Turns one GET/HEAD /stream/{token} request into a Reply.

  Handle() may block on the origin (locator refresh, first chunk) and is
  run off the connection's event loop. It never touches a socket; the
  session writes the reply.
*/
class StreamHandler {
 public:
  using Request = boost::beast::http::request<boost::beast::http::empty_body>;

  struct Reply {
    boost::beast::http::response<boost::beast::http::string_body> message;

    // Write only the header block of `message`. Set for HEAD and for
    // streamed bodies, whose bytes come from `body`.
    bool header_only = false;

    // Lazy body; null for errors and HEAD.
    std::unique_ptr<streaming::ChunkRemapper> body;

    std::string token;
  };

  explicit StreamHandler(std::shared_ptr<streamgate::core::StreamOrchestrator> orchestrator);

  // Never throws; failures become a 500 reply.
  Reply Handle(const Request& req);

  // Token from a request target such as "/stream/abc?x=1". nullopt for other routes.
  static std::optional<std::string> TokenFromTarget(std::string_view target);

 private:
  Reply Dispatch(const Request& req);

  std::shared_ptr<streamgate::core::StreamOrchestrator> orchestrator_;
};

} // namespace streamgate::http
