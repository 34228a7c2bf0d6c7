#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace csvjson::parser {

/// Separators considered by detect_separator, in tie-break priority order.
inline constexpr std::array<char, 3> kCandidateSeparators = {',', ';', '\t'};

/// Pick the most frequent candidate separator in `text`.
///
/// Occurrences are counted anywhere in the text, quoted content included, so
/// a free-text column full of commas can out-vote the real delimiter. A later
/// candidate wins only on a strictly greater count. Returns std::nullopt when
/// no candidate occurs at all.
[[nodiscard]] auto detect_separator(std::string_view text) -> std::optional<char>;

/// Human-readable separator name: "comma", "semicolon", "tab" or 'x'.
[[nodiscard]] auto separator_name(char separator) -> std::string;

/// Whether `separator` can delimit fields (it must not collide with quoting
/// or line breaks).
[[nodiscard]] constexpr auto is_valid_separator(char separator) noexcept -> bool {
    return separator != '"' && separator != '\n' && separator != '\r';
}

}  // namespace csvjson::parser
