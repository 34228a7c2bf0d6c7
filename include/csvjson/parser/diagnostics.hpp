#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvjson::parser {

/// 1-based line and column of a byte offset.
struct SourcePosition {
    std::size_t line = 1;
    std::size_t column = 1;
};

/// Parse error reported at the furthest point any grammar alternative reached.
struct ParseError {
    /// Sorted, de-duplicated descriptions of what would have matched.
    std::vector<std::string> expected;
    /// UTF-8 sequence at `offset`, or std::nullopt at end of input.
    std::optional<std::string> found;
    std::size_t offset = 0;
    std::size_t line = 0;
    std::size_t column = 0;
    /// Literal text of the line containing `offset`.
    std::string source_line;
    /// "Expected ... but ... found."
    std::string message;

    /// Caller-facing text: message, location and the offending line.
    [[nodiscard]] auto format() const -> std::string;
};

/// Compute the line and column of `offset`.
///
/// "\r\n" counts as a single break; lone "\r", U+2028 and U+2029 break too.
/// Columns advance once per code point.
[[nodiscard]] auto locate(std::string_view input, std::size_t offset) -> SourcePosition;

/// Text of the line containing `offset`, without its line breaks. Breaks are
/// the ones locate() counts, so the text always matches the reported line.
[[nodiscard]] auto source_line(std::string_view input, std::size_t offset) -> std::string_view;

/// "end of input", "a", or "a, b or c".
[[nodiscard]] auto describe_expected(const std::vector<std::string>& expected) -> std::string;

/// Quoted, escaped form of `found`, or "end of input".
[[nodiscard]] auto describe_found(const std::optional<std::string>& found) -> std::string;

/// Build a complete ParseError for a failure at `offset`.
///
/// `expected` is sorted and de-duplicated here.
[[nodiscard]] auto make_parse_error(std::string_view input, std::size_t offset,
                                    std::vector<std::string> expected) -> ParseError;

}  // namespace csvjson::parser
