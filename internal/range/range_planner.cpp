#include "range_planner.hpp"

#include <charconv>

namespace streamgate::range {

namespace {

constexpr std::string_view kUnitPrefix = "bytes=";

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Whole string must be decimal digits.
std::optional<uint64_t> ParseNumber(std::string_view s) {
  if (s.empty()) return std::nullopt;
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace

std::optional<ByteRange> Plan(std::optional<std::string_view> range_header, std::optional<uint64_t> total_size) {
  if (!range_header) {
    return ByteRange{0, std::nullopt};
  }

  auto header = Trim(*range_header);
  if (header.substr(0, kUnitPrefix.size()) != kUnitPrefix) {
    return std::nullopt;
  }

  const auto range_set = Trim(header.substr(kUnitPrefix.size()));
  const auto dash      = range_set.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }

  const auto start_str = Trim(range_set.substr(0, dash));
  const auto end_str   = Trim(range_set.substr(dash + 1));

  // suffix form: last N bytes
  if (start_str.empty()) {
    if (!total_size) return std::nullopt;
    const auto suffix = ParseNumber(end_str);
    if (!suffix || *suffix == 0 || *total_size == 0) return std::nullopt;
    const uint64_t start = *suffix >= *total_size ? 0 : *total_size - *suffix;
    return ByteRange{start, *total_size - 1};
  }

  const auto start = ParseNumber(start_str);
  if (!start) return std::nullopt;

  std::optional<uint64_t> end;
  if (!end_str.empty()) {
    end = ParseNumber(end_str);
    if (!end || *end < *start) return std::nullopt;
  }

  if (total_size) {
    if (*start >= *total_size) return std::nullopt;
    if (!end || *end >= *total_size) end = *total_size - 1;
  }

  return ByteRange{*start, end};
}

} // namespace streamgate::range
