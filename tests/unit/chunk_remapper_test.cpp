#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/streaming/chunk_remapper.hpp"
#include "tests/unit/fake_origin.hpp"

namespace {

using streamgate::range::ByteRange;
using streamgate::streaming::ChunkRemapper;
using streamgate::streaming::PlanOriginWindow;
using streamgate::testing::Bytes;
using streamgate::testing::FakeOrigin;

struct Drained {
  std::string body;
  uint64_t    largest_piece = 0;
  bool        truncated     = false;
};

Drained Drain(FakeOrigin& origin, ByteRange range, uint64_t output_chunk_size) {
  const auto window = PlanOriginWindow(range, origin.ChunkSize());
  auto       source = origin.OpenChunkedDownload("loc", window.offset_bytes, window.limit_bytes);

  ChunkRemapper remapper(std::move(source), window.skip_bytes, range.Length(), output_chunk_size);
  remapper.Prime();

  Drained out;
  while (auto piece = remapper.Next()) {
    assert(!piece->empty());
    out.largest_piece = std::max<uint64_t>(out.largest_piece, piece->size());
    out.body += *piece;
  }
  out.truncated = remapper.Truncated();
  assert(remapper.Emitted() == out.body.size());
  return out;
}

void TestPlanOriginWindow() {
  auto window = PlanOriginWindow(ByteRange{500, 999}, 300);
  assert(window.offset_bytes == 300);
  assert(window.skip_bytes == 200);
  assert(window.limit_bytes == 900u);

  window = PlanOriginWindow(ByteRange{0, 299}, 300);
  assert(window.offset_bytes == 0);
  assert(window.skip_bytes == 0);
  assert(window.limit_bytes == 600u);

  window = PlanOriginWindow(ByteRange{1234, std::nullopt}, 1024);
  assert(window.offset_bytes == 1024);
  assert(window.skip_bytes == 210);
  assert(!window.limit_bytes.has_value());

  bool threw = false;
  try {
    (void)PlanOriginWindow(ByteRange{0, 1}, 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestWindowsMatchReferenceBytes() {
  const uint64_t object_size = 2500;
  const ByteRange ranges[]   = {{0, 0}, {0, 2499}, {1, 1}, {6, 7}, {7, 13}, {1023, 1025}, {1000, 2047}, {2499, 2499}, {333, 1777}};

  for (uint64_t chunk_size : {1u, 7u, 1024u}) {
    for (uint64_t output : {1u, 3u, 4096u}) {
      for (const auto& range : ranges) {
        FakeOrigin origin(object_size, chunk_size);
        auto       drained = Drain(origin, range, output);

        assert(drained.body == Bytes(range.start, *range.Length()));
        assert(drained.largest_piece <= output);
        assert(!drained.truncated);
      }
    }
  }
}

void TestOpenEndedWindowReadsToOriginEnd() {
  FakeOrigin origin(3000, 1024);
  auto       drained = Drain(origin, ByteRange{100, std::nullopt}, 4096);
  assert(drained.body == Bytes(100, 2900));
  assert(!drained.truncated);
}

void TestShortOriginChunksAreSkippedAcross() {
  FakeOrigin origin(2000, 300);
  origin.short_chunk = 50;  // origin yields pieces smaller than its nominal chunk

  auto drained = Drain(origin, ByteRange{500, 999}, 64);
  assert(drained.body == Bytes(500, 500));
}

void TestStopsPullingOnceWindowIsComplete() {
  FakeOrigin origin(1 << 20, 100);

  const ByteRange range{0, 149};
  const auto      window = PlanOriginWindow(range, origin.ChunkSize());
  ChunkRemapper   remapper(origin.OpenChunkedDownload("loc", window.offset_bytes, window.limit_bytes), window.skip_bytes, range.Length(), 4096);

  std::string body;
  while (auto piece = remapper.Next()) body += *piece;

  assert(body == Bytes(0, 150));
  assert(origin.chunks_served.load() == 2);
  assert(origin.cancels.load() == 1);
}

void TestShortOriginEndsSequence() {
  FakeOrigin origin(1000, 128);
  origin.truncate_at = 600;

  auto drained = Drain(origin, ByteRange{100, 899}, 4096);
  assert(drained.truncated);
  assert(drained.body == Bytes(100, 500));
}

void TestCancelStopsTheSequence() {
  FakeOrigin origin(1 << 20, 1024);

  const ByteRange range{0, (1 << 20) - 1};
  const auto      window = PlanOriginWindow(range, origin.ChunkSize());
  ChunkRemapper   remapper(origin.OpenChunkedDownload("loc", window.offset_bytes, window.limit_bytes), window.skip_bytes, range.Length(), 512);

  assert(remapper.Next().has_value());
  std::thread canceller([&] { remapper.Cancel(); });
  canceller.join();

  assert(!remapper.Next().has_value());
  assert(origin.cancels.load() == 1);
  assert(origin.chunks_served.load() == 1);
  assert(!remapper.Truncated());
}

void TestAbandonedRemapperCancelsSource() {
  FakeOrigin origin(1 << 20, 1024);
  {
    auto source = origin.OpenChunkedDownload("loc", 0, std::nullopt);
    ChunkRemapper remapper(std::move(source), 0, std::nullopt, 1024);
    assert(remapper.Next().has_value());
  }
  assert(origin.cancels.load() == 1);
}

void TestEndToEndScenario() {
  // 1000-byte object, Range: bytes=500-, origin chunk size 300.
  FakeOrigin origin(1000, 300);

  const ByteRange range{500, 999};
  const auto      window = PlanOriginWindow(range, origin.ChunkSize());
  assert(window.offset_bytes / origin.ChunkSize() == 1);
  assert(window.skip_bytes == 200);

  auto drained = Drain(origin, range, 4096);
  assert(drained.body.size() == 500);
  assert(drained.body == Bytes(500, 500));
  assert(origin.Opens().size() == 1);
  assert(origin.Opens()[0].offset_bytes == 300);
}

} // namespace

int main() {
  TestPlanOriginWindow();
  TestWindowsMatchReferenceBytes();
  TestOpenEndedWindowReadsToOriginEnd();
  TestShortOriginChunksAreSkippedAcross();
  TestStopsPullingOnceWindowIsComplete();
  TestShortOriginEndsSequence();
  TestCancelStopsTheSequence();
  TestAbandonedRemapperCancelsSource();
  TestEndToEndScenario();

  std::cout << "streamgate_unit_chunk_remapper: pass\n";
  return 0;
}
