#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace streamgate::db::sql {

/*
  Parameter abstraction for the SQLite statement binder.

  Positional: the Nth element binds the Nth '?'.
*/

using Param = std::variant<std::nullptr_t, int64_t, uint64_t, std::string>;

using Params = std::vector<Param>;

} // namespace streamgate::db::sql
