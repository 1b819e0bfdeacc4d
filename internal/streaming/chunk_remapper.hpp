#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/origin/media_origin.hpp"
#include "internal/range/range_planner.hpp"

namespace streamgate::streaming {

// Origin-side request covering a byte window.
struct OriginWindow {
  uint64_t                offset_bytes = 0;  // chunk aligned
  std::optional<uint64_t> limit_bytes;       // whole chunks, one extra for alignment slack
  uint64_t                skip_bytes = 0;    // leading bytes to drop from the session
};

OriginWindow PlanOriginWindow(const range::ByteRange& range, uint64_t origin_chunk_size);

/*
  Re-slices an origin download into the exact requested byte window.

  - skip_bytes leading bytes are dropped (across chunks if the origin yields
    short ones)
  - with a known length, output stops at exactly that many bytes and the
    origin session is cancelled, never drained
  - every returned piece is at most output_chunk_size bytes
  - an origin that ends early just ends the sequence; Truncated() reports it

  Single pass, single consumer. Cancel() may be called from another thread.
*/
class ChunkRemapper {
 public:
  ChunkRemapper(std::unique_ptr<origin::ChunkSource> source, uint64_t skip_bytes, std::optional<uint64_t> length, uint64_t output_chunk_size);
  ~ChunkRemapper();

  ChunkRemapper(const ChunkRemapper&)            = delete;
  ChunkRemapper& operator=(const ChunkRemapper&) = delete;

  // Pulls the first origin chunk so that origin failures surface before any
  // response bytes are committed.
  void Prime();

  // Next output piece; nullopt once the window is complete or the origin ended.
  std::optional<std::string> Next();

  void Cancel();

  bool Truncated() const {
    return truncated_;
  }

  uint64_t Emitted() const {
    return emitted_;
  }

 private:
  // Refills pending_ from the origin. false at end of stream.
  bool Fill();
  void Finish();

  std::unique_ptr<origin::ChunkSource> source_;
  uint64_t                             skip_remaining_;
  std::optional<uint64_t>              remaining_;
  uint64_t                             output_chunk_size_;

  std::string pending_;
  size_t      pending_pos_ = 0;
  uint64_t    emitted_     = 0;
  bool        done_        = false;
  bool        truncated_   = false;

  std::atomic<bool> cancelled_{false};
};

} // namespace streamgate::streaming
