#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace streamgate::range {

// Inclusive byte window. end is unknown when the resource size is unknown
// and the request left it open.
struct ByteRange {
  uint64_t                start = 0;
  std::optional<uint64_t> end;

  // Number of bytes in the window, when end is known.
  std::optional<uint64_t> Length() const {
    if (!end) return std::nullopt;
    return *end - start + 1;
  }

  bool operator==(const ByteRange&) const = default;
};

/*
  Translates an HTTP Range header into a byte window.

    no header                 -> {0, nullopt}
    "bytes=S-E" / "bytes=S-"  -> {S, min(E, size-1)} (E passes through when size is unknown)
    "bytes=-N"                -> {max(size-N, 0), size-1}, size required

  Returns nullopt when the header is not satisfiable: wrong unit, malformed
  or multiple ranges, S >= size, E < S, a suffix without a known size, or
  an empty suffix window.
*/
std::optional<ByteRange> Plan(std::optional<std::string_view> range_header, std::optional<uint64_t> total_size);

} // namespace streamgate::range
