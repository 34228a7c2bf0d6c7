#pragma once

#include <csvjson/core/value.hpp>
#include <csvjson/parser/diagnostics.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace csvjson {

/// Conversion settings. Every switch defaults to off.
struct Options {
    /// Field delimiter. When unset it is detected from the text.
    std::optional<char> separator;
    /// Convert cells that look numeric into numbers.
    bool parse_numbers = false;
    /// Convert cells holding JSON text (numbers, true, false, null, [...],
    /// {...}) into JSON values.
    bool parse_json = false;
    /// Pivot rows and columns before the header is read.
    bool transpose = false;
    /// Key records by their first column instead of returning a list.
    bool hash = false;
    /// Return the parsed cell matrix untouched: no header, no records.
    bool return_array = false;
};

enum class ErrorKind : std::uint8_t {
    InputEmpty,
    SeparatorUndetectable,
    InvalidSeparator,
    EmptyHeader,
    SyntaxError,
};

/// Conversion failure. `syntax` is set only for ErrorKind::SyntaxError.
struct ConvertError {
    ErrorKind kind = ErrorKind::InputEmpty;
    std::string message;
    std::optional<parser::ParseError> syntax;

    /// Message followed, for syntax errors, by location and source line.
    [[nodiscard]] auto format() const -> std::string;
};

using ConvertResult = std::expected<Output, ConvertError>;

/// Convert delimited text into records.
///
/// Pipeline: separator detection, parsing, optional transpose, then either the
/// raw matrix (return_array) or header extraction and record mapping into a
/// RecordList or, with `hash`, a RecordMap. All-or-nothing: any failure
/// returns a ConvertError and no partial output.
[[nodiscard]] auto convert(std::string_view text, const Options& options = {}) -> ConvertResult;

/// Stable name of an error kind, e.g. "SyntaxError".
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

}  // namespace csvjson
