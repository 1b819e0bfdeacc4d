#include "chunk_remapper.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace streamgate::streaming {

OriginWindow PlanOriginWindow(const range::ByteRange& range, uint64_t origin_chunk_size) {
  if (origin_chunk_size == 0) {
    throw util::InvalidArgument("origin chunk size must be non-zero");
  }

  OriginWindow window;
  window.offset_bytes = (range.start / origin_chunk_size) * origin_chunk_size;
  window.skip_bytes   = range.start - window.offset_bytes;

  if (const auto length = range.Length()) {
    const uint64_t chunks = (*length + origin_chunk_size - 1) / origin_chunk_size + 1;
    window.limit_bytes    = chunks * origin_chunk_size;
  }
  return window;
}

ChunkRemapper::ChunkRemapper(std::unique_ptr<origin::ChunkSource> source, uint64_t skip_bytes, std::optional<uint64_t> length,
                             uint64_t output_chunk_size)
    : source_(std::move(source)), skip_remaining_(skip_bytes), remaining_(length), output_chunk_size_(output_chunk_size) {
  if (!source_) {
    throw util::InvalidArgument("chunk remapper requires an origin session");
  }
  if (output_chunk_size_ == 0) {
    throw util::InvalidArgument("output chunk size must be non-zero");
  }
  if (remaining_ && *remaining_ == 0) {
    Finish();
  }
}

ChunkRemapper::~ChunkRemapper() {
  if (!done_ && !cancelled_.load()) {
    source_->Cancel();
  }
}

void ChunkRemapper::Prime() {
  if (pending_pos_ < pending_.size() || done_ || cancelled_.load()) {
    return;
  }
  Fill();
}

std::optional<std::string> ChunkRemapper::Next() {
  if (cancelled_.load()) {
    return std::nullopt;
  }
  if (pending_pos_ >= pending_.size() && !Fill()) {
    return std::nullopt;
  }

  const size_t take = static_cast<size_t>(std::min<uint64_t>(output_chunk_size_, pending_.size() - pending_pos_));
  std::string  piece;
  if (pending_pos_ == 0 && take == pending_.size()) {
    piece.swap(pending_);
  } else {
    piece = pending_.substr(pending_pos_, take);
    pending_pos_ += take;
  }
  if (pending_pos_ >= pending_.size()) {
    pending_.clear();
    pending_pos_ = 0;
  }
  emitted_ += take;
  return piece;
}

void ChunkRemapper::Cancel() {
  if (!cancelled_.exchange(true)) {
    source_->Cancel();
  }
}

bool ChunkRemapper::Fill() {
  while (!done_ && !cancelled_.load()) {
    if (remaining_ && *remaining_ == 0) {
      Finish();
      return false;
    }

    auto chunk = source_->Next();
    if (!chunk) {
      done_ = true;
      if (remaining_ && *remaining_ > 0 && !cancelled_.load()) {
        truncated_ = true;
        STREAMGATE_LOG_WARN("origin stream ended short", {observability::UintField("emitted", emitted_),
                                                          observability::UintField("missing", *remaining_)});
      }
      return false;
    }

    size_t begin = 0;
    if (skip_remaining_ > 0) {
      const auto drop = std::min<uint64_t>(skip_remaining_, chunk->size());
      skip_remaining_ -= drop;
      begin = static_cast<size_t>(drop);
    }
    size_t usable = chunk->size() - begin;
    if (remaining_) {
      usable = static_cast<size_t>(std::min<uint64_t>(usable, *remaining_));
      *remaining_ -= usable;
    }
    if (usable == 0) {
      continue;
    }

    if (begin == 0 && usable == chunk->size()) {
      pending_ = std::move(*chunk);
    } else {
      pending_ = chunk->substr(begin, usable);
    }
    pending_pos_ = 0;

    // Do not wait on the origin once the window is complete.
    if (remaining_ && *remaining_ == 0) {
      Finish();
    }
    return true;
  }
  return false;
}

void ChunkRemapper::Finish() {
  if (!done_) {
    done_ = true;
    source_->Cancel();
  }
}

} // namespace streamgate::streaming
