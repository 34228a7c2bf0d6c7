#pragma once

#include <csvjson/core/value.hpp>

namespace csvjson::table {

/// Zip-to-longest pivot.
///
/// The result has one row per column of the longest input row. Row `i` holds
/// cell `i` of every input row, or a missing cell where that row is too short.
[[nodiscard]] auto transpose(const RawTable& table) -> RawTable;

}  // namespace csvjson::table
