#include "token.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <random>

namespace streamgate::util {

namespace {

constexpr char kUrlSafeAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::size_t kTokenBytes = 32;

std::string Base64UrlEncode(const uint8_t* data, std::size_t size) {
  std::string out;
  out.reserve((size * 4 + 2) / 3);

  std::size_t i = 0;
  for (; i + 3 <= size; i += 3) {
    const uint32_t v = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
    out.push_back(kUrlSafeAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[(v >> 6) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[v & 0x3F]);
  }

  const std::size_t rest = size - i;
  if (rest == 1) {
    const uint32_t v = uint32_t{data[i]} << 16;
    out.push_back(kUrlSafeAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[(v >> 12) & 0x3F]);
  } else if (rest == 2) {
    const uint32_t v = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8);
    out.push_back(kUrlSafeAlphabet[(v >> 18) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[(v >> 12) & 0x3F]);
    out.push_back(kUrlSafeAlphabet[(v >> 6) & 0x3F]);
  }
  return out;
}

} // namespace

std::string MintToken() {
  // random_device reads the OS entropy source on Linux; tokens are capabilities.
  static thread_local std::random_device rd;

  std::array<uint8_t, kTokenBytes> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += sizeof(uint32_t)) {
    const uint32_t word = rd();
    for (std::size_t j = 0; j < sizeof(uint32_t) && i + j < bytes.size(); ++j) {
      bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
    }
  }
  return Base64UrlEncode(bytes.data(), bytes.size());
}

std::string NormalizeSectionName(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());

  bool pending_space = false;
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

std::string SectionSlug(std::string_view raw) {
  const auto  normalized = NormalizeSectionName(raw);
  std::string slug;
  slug.reserve(normalized.size());

  bool pending_dash = false;
  for (char c : normalized) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      if (pending_dash && !slug.empty()) {
        slug.push_back('-');
      }
      pending_dash = false;
      slug.push_back(c);
    } else {
      pending_dash = true;
    }
  }
  return slug;
}

} // namespace streamgate::util
