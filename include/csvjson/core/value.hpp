#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace csvjson {

/// A single parsed cell.
///
/// The parser always produces an engaged cell. A disengaged cell marks a
/// position that a ragged row does not reach (see table::transpose) and
/// reads as the empty string downstream.
using Cell = std::optional<std::string>;

/// One parsed line, fields in grammar order, quotes already decoded.
using Row = std::vector<Cell>;

/// The parsed, pre-typed cell matrix. Rows may differ in length.
using RawTable = std::vector<Row>;

/// Coercion target: string, number, boolean, null, array or object.
/// Objects keep their keys in insertion order.
using Value = nlohmann::ordered_json;

/// A Value holding an object keyed by header name, in header order.
using Record = Value;

/// Array-mode output: one record per data row, in input order.
using RecordList = std::vector<Record>;

/// Hash-mode output: record keyed by the first column of its row.
using RecordMap = nlohmann::ordered_map<std::string, Record>;

/// Result of a conversion: records, keyed records, or the raw matrix.
using Output = std::variant<RecordList, RecordMap, RawTable>;

/// Render any output shape as a JSON value.
///
/// RecordList becomes an array of objects, RecordMap an object of objects and
/// RawTable an array of arrays in which missing cells are null.
[[nodiscard]] auto to_json(const Output& output) -> Value;

}  // namespace csvjson
