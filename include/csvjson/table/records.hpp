#pragma once

#include <csvjson/core/value.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace csvjson::table {

/// Value coercion switches for the record mapper.
struct MapOptions {
    /// Decode cells that look numeric as JSON numbers.
    bool parse_numbers = false;
    /// Decode every cell that is valid JSON text.
    bool parse_json = false;
};

/// Whether `text` is a plain decimal number.
///
///   [+-]? ( digits ('.' digits?)? | '.' digits ) ([eE] [+-]? digits)?
///
/// The whole text must match: no surrounding whitespace, hexadecimal,
/// Infinity or NaN. The empty string is not numeric.
[[nodiscard]] auto is_numeric(std::string_view text) noexcept -> bool;

/// Coerce a cleaned cell into a Value.
///
/// When parse_json is set, or parse_numbers is set and the text is numeric,
/// the text is decoded as JSON; text that fails to decode stays a string.
[[nodiscard]] auto coerce_value(std::string_view cleaned, const MapOptions& options) -> Value;

/// Build one record per row, keyed by `keys`. Short rows read as "".
[[nodiscard]] auto map_records(const std::vector<std::string>& keys, std::span<const Row> rows,
                               const MapOptions& options) -> RecordList;

/// Build records keyed by each row's first cell, which is not stored as a
/// field. A repeated key replaces the earlier record in place.
[[nodiscard]] auto map_keyed_records(const std::vector<std::string>& keys,
                                     std::span<const Row> rows, const MapOptions& options)
    -> RecordMap;

}  // namespace csvjson::table
