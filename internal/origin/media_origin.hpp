#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace streamgate::origin {

/*
  Narrow contract streamgate needs from the messaging backend that actually
  holds the media bytes.

  Rate limits and outages surface as util::OriginUnavailable (with the
  backend's retry-after hint when it gave one). Callers never retry
  internally.
*/

// One open download session. Not thread-safe except for Cancel().
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  // Blocks until the next origin chunk arrives. nullopt at end of stream
  // (including after Cancel()).
  virtual std::optional<std::string> Next() = 0;

  // Abandons the session; safe to call from another thread and more than once.
  virtual void Cancel() = 0;
};

class MediaOrigin {
 public:
  virtual ~MediaOrigin() = default;

  // Fresh file locator for a message, nullopt when the backend no longer
  // knows it. Transient failures also yield nullopt.
  virtual std::optional<std::string> Resolve(int64_t chat_id, int64_t message_id) = 0;

  // offset_bytes must be a multiple of ChunkSize(). limit_bytes bounds the
  // session; nullopt reads to the end of the object.
  virtual std::unique_ptr<ChunkSource> OpenChunkedDownload(const std::string& locator, uint64_t offset_bytes,
                                                           std::optional<uint64_t> limit_bytes) = 0;

  // Fixed granularity of the chunks yielded by ChunkSource::Next().
  virtual uint64_t ChunkSize() const = 0;
};

} // namespace streamgate::origin
