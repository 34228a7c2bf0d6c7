#pragma once

#include <csvjson/core/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace csvjson::table {

/// Suffix joining a repeated header to its occurrence number ("x__1").
inline constexpr std::string_view kDuplicateSuffix = "__";

/// Trim surrounding whitespace, then drop one leading and one trailing '"'
/// when both are present. A missing cell cleans to "".
[[nodiscard]] auto clean_cell(const Cell& cell) -> std::string;

/// Rename repeated keys so every key is unique.
///
/// The rightmost occurrence of a value keeps it unchanged; moving left, the
/// other occurrences become value__1, value__2, and so on.
[[nodiscard]] auto uniquify(std::vector<std::string> keys) -> std::vector<std::string>;

/// Clean and uniquify a header row into column keys, preserving order.
[[nodiscard]] auto extract_header(const Row& row) -> std::vector<std::string>;

}  // namespace csvjson::table
