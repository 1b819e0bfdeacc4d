#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/core/token_store.hpp"
#include "internal/origin/media_origin.hpp"
#include "internal/streaming/chunk_remapper.hpp"
#include "internal/util/errors.hpp"
#include "streamgate/v1/types.pb.h"

namespace streamgate::core {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct StreamResponse {
  std::optional<util::ErrorKind> error;

  unsigned   status = 200;
  HeaderList headers;

  // Set with kOriginUnavailable when the origin named a back-off.
  std::optional<std::chrono::seconds> retry_after;

  streamgate::v1::AccessTier tier = streamgate::v1::ACCESS_TIER_NORMAL;

  // Lazy body; null for errors and header-only requests.
  std::unique_ptr<streaming::ChunkRemapper> body;
};

/*
  Turns (token, Range header) into response headers and a lazy byte
  sequence pulled from the media origin.

  The orchestrator never charges or renders anything. Premium references
  are refused only when premium streaming is disabled.
*/
class StreamOrchestrator {
 public:
  struct Options {
    uint64_t output_chunk_size       = 524288;
    bool     allow_premium_streaming = true;
  };

  StreamOrchestrator(std::shared_ptr<TokenStore> store, std::shared_ptr<origin::MediaOrigin> origin, Options options);

  StreamResponse OpenStream(const std::string& token, std::optional<std::string_view> range_header, bool with_body = true);

 private:
  // Fresh locator from the origin when it can refresh one, else the stored one.
  std::optional<std::string> ResolveLocator(const streamgate::v1::MediaReference& reference);

  std::shared_ptr<TokenStore>          store_;
  std::shared_ptr<origin::MediaOrigin> origin_;
  Options                              options_;
};

unsigned HttpStatusFor(util::ErrorKind kind);

} // namespace streamgate::core
