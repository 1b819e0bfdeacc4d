#pragma once

#include <string>
#include <string_view>

namespace streamgate::util {

/*
  Token and name helpers.

  Tokens are 32 random bytes encoded as unpadded URL-safe base64 (43 chars).
*/

std::string MintToken();

// Trim, collapse whitespace runs to one space, lowercase.
std::string NormalizeSectionName(std::string_view raw);

// Normalized name with runs of non [a-z0-9] mapped to '-' and edges trimmed.
// Empty when the name carries no slug characters.
std::string SectionSlug(std::string_view raw);

} // namespace streamgate::util
