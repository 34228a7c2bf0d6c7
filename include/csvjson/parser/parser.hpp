#pragma once

#include <csvjson/core/value.hpp>
#include <csvjson/parser/diagnostics.hpp>

#include <expected>
#include <string_view>

namespace csvjson::parser {

/// Result type for parse operations.
using ParseResult = std::expected<RawTable, ParseError>;

/// Parse delimited text into a table of raw fields.
///
/// Grammar, with SEP = `separator`:
///
///   Document      := LineBreak* Line (LineBreak+ Line)* LineBreak*
///   Line          := Field (SEP Field)*        (consumes at least one char)
///   Field         := QuotedField | UnquotedField
///   QuotedField   := '"' ('""' | [^"])* '"'
///   UnquotedField := [^SEP \n \r]*             (does not start with '"')
///   LineBreak     := '\n' | '\r'
///
/// On failure the error points at the furthest position any alternative
/// reached, with every expectation recorded there.
[[nodiscard]] auto parse(std::string_view input, char separator) -> ParseResult;

}  // namespace csvjson::parser
