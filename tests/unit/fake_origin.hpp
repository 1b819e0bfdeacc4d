#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/origin/media_origin.hpp"
#include "internal/util/errors.hpp"

namespace streamgate::testing {

// Deterministic object content: byte i is (i % 251).
inline std::string Bytes(uint64_t offset, uint64_t count) {
  std::string out(count, '\0');
  for (uint64_t i = 0; i < count; ++i) out[i] = static_cast<char>((offset + i) % 251);
  return out;
}

struct OpenCall {
  std::string             locator;
  uint64_t                offset_bytes = 0;
  std::optional<uint64_t> limit_bytes;
};

/*
  In-process origin over a synthetic object.

  Serves origin chunks of exactly chunk_size bytes (the last one may be
  short), or of short_chunk bytes when that is set. Chunks stop early at
  truncate_at. Counts how many chunks each session handed out.
*/
class FakeOrigin final : public origin::MediaOrigin {
 public:
  FakeOrigin(uint64_t object_size, uint64_t chunk_size) : object_size_(object_size), chunk_size_(chunk_size) {
  }

  std::optional<std::string> Resolve(int64_t chat_id, int64_t message_id) override {
    resolve_calls.fetch_add(1);
    if (resolve_throws) {
      throw util::OriginUnavailable("resolve rate limited", std::chrono::seconds(3));
    }
    if (!resolvable) return std::nullopt;
    return "fresh:" + std::to_string(chat_id) + ":" + std::to_string(message_id);
  }

  std::unique_ptr<origin::ChunkSource> OpenChunkedDownload(const std::string& locator, uint64_t offset_bytes,
                                                           std::optional<uint64_t> limit_bytes) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      opens_.push_back({locator, offset_bytes, limit_bytes});
    }
    if (offset_bytes % chunk_size_ != 0) {
      throw util::InvalidArgument("unaligned offset");
    }
    return std::make_unique<Session>(*this, offset_bytes, limit_bytes);
  }

  uint64_t ChunkSize() const override {
    return chunk_size_;
  }

  std::vector<OpenCall> Opens() {
    std::lock_guard<std::mutex> lock(mutex_);
    return opens_;
  }

  std::atomic<bool>       resolvable{true};
  std::atomic<bool>       resolve_throws{false};
  std::atomic<bool>       rate_limited{false};
  uint64_t                short_chunk = 0;
  std::optional<uint64_t> truncate_at;

  std::atomic<int> resolve_calls{0};
  std::atomic<int> chunks_served{0};
  std::atomic<int> cancels{0};

 private:
  class Session final : public origin::ChunkSource {
   public:
    Session(FakeOrigin& origin, uint64_t offset, std::optional<uint64_t> limit) : origin_(origin), position_(offset) {
      end_ = origin_.object_size_;
      if (origin_.truncate_at && *origin_.truncate_at < end_) end_ = *origin_.truncate_at;
      if (limit && offset + *limit < end_) end_ = offset + *limit;
    }

    std::optional<std::string> Next() override {
      if (cancelled_.load()) return std::nullopt;
      if (origin_.rate_limited) {
        throw util::OriginUnavailable("download rate limited", std::chrono::seconds(7));
      }
      if (position_ >= end_) return std::nullopt;

      const uint64_t step  = origin_.short_chunk > 0 ? origin_.short_chunk : origin_.chunk_size_;
      const uint64_t count = std::min(step, end_ - position_);
      auto           chunk = Bytes(position_, count);
      position_ += count;
      origin_.chunks_served.fetch_add(1);
      return chunk;
    }

    void Cancel() override {
      if (!cancelled_.exchange(true)) origin_.cancels.fetch_add(1);
    }

   private:
    FakeOrigin&       origin_;
    uint64_t          position_;
    uint64_t          end_ = 0;
    std::atomic<bool> cancelled_{false};
  };

  uint64_t object_size_;
  uint64_t chunk_size_;

  std::mutex            mutex_;
  std::vector<OpenCall> opens_;
};

} // namespace streamgate::testing
