#include <csvjson/parser/diagnostics.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace csvjson::parser {

namespace {

// U+2028 LINE SEPARATOR and U+2029 PARAGRAPH SEPARATOR share this prefix.
constexpr std::string_view kUnicodeBreakPrefix = "\xE2\x80";

auto is_continuation_byte(unsigned char byte) -> bool {
    return (byte & 0xC0U) == 0x80U;
}

auto unicode_break_at(std::string_view input, std::size_t i) -> bool {
    if (input.substr(i, kUnicodeBreakPrefix.size()) != kUnicodeBreakPrefix ||
        i + 2 >= input.size()) {
        return false;
    }
    const auto last = static_cast<unsigned char>(input[i + 2]);
    return last == 0xA8U || last == 0xA9U;
}

// Byte length of the line break starting at `i`, or 0 when there is none.
auto break_length(std::string_view input, std::size_t i) -> std::size_t {
    if (input[i] == '\n' || input[i] == '\r') {
        return 1;
    }
    return unicode_break_at(input, i) ? kUnicodeBreakPrefix.size() + 1 : 0;
}

// Length of the UTF-8 sequence introduced by `lead`; 1 for stray bytes.
auto sequence_length(unsigned char lead) -> std::size_t {
    if ((lead & 0xE0U) == 0xC0U) {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U) {
        return 4;
    }
    return 1;
}

auto escape_token(std::string_view token) -> std::string {
    std::string out;
    out.reserve(token.size() + 2);
    out.push_back('"');
    for (char ch : token) {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                if (byte < 0x20U || byte == 0x7FU) {
                    out += fmt::format("\\x{:02X}", byte);
                } else {
                    out.push_back(ch);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("{} On line {} and column {}.\n{}", message, line, column, source_line);
}

auto locate(std::string_view input, std::size_t offset) -> SourcePosition {
    SourcePosition position;
    bool seen_cr = false;
    const std::size_t end = std::min(offset, input.size());
    std::size_t i = 0;
    while (i < end) {
        const char ch = input[i];
        if (ch == '\n') {
            if (!seen_cr) {
                position.line += 1;
            }
            position.column = 1;
            seen_cr = false;
            i += 1;
            continue;
        }
        if (ch == '\r') {
            position.line += 1;
            position.column = 1;
            seen_cr = true;
            i += 1;
            continue;
        }
        seen_cr = false;
        if (unicode_break_at(input, i)) {
            position.line += 1;
            position.column = 1;
            i += kUnicodeBreakPrefix.size() + 1;
            continue;
        }
        if (!is_continuation_byte(static_cast<unsigned char>(ch))) {
            position.column += 1;
        }
        i += 1;
    }
    return position;
}

auto source_line(std::string_view input, std::size_t offset) -> std::string_view {
    offset = std::min(offset, input.size());
    std::size_t begin = 0;
    std::size_t i = 0;
    while (i < offset) {
        if (const auto length = break_length(input, i); length > 0) {
            i += length;
            begin = i;
        } else {
            i += 1;
        }
    }
    std::size_t end = std::max(begin, offset);
    while (end < input.size() && break_length(input, end) == 0) {
        end += 1;
    }
    return input.substr(begin, end - begin);
}

auto describe_expected(const std::vector<std::string>& expected) -> std::string {
    switch (expected.size()) {
        case 0:
            return "end of input";
        case 1:
            return expected.front();
        default:
            break;
    }
    std::string out;
    for (std::size_t i = 0; i + 1 < expected.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += expected[i];
    }
    out += " or ";
    out += expected.back();
    return out;
}

auto describe_found(const std::optional<std::string>& found) -> std::string {
    if (!found.has_value()) {
        return "end of input";
    }
    return escape_token(*found);
}

auto make_parse_error(std::string_view input, std::size_t offset,
                      std::vector<std::string> expected) -> ParseError {
    std::sort(expected.begin(), expected.end());
    expected.erase(std::unique(expected.begin(), expected.end()), expected.end());

    std::optional<std::string> found;
    if (offset < input.size()) {
        const auto length = sequence_length(static_cast<unsigned char>(input[offset]));
        found = std::string(input.substr(offset, length));
    }

    const auto position = locate(input, offset);
    ParseError error{
        .expected = std::move(expected),
        .found = std::move(found),
        .offset = offset,
        .line = position.line,
        .column = position.column,
        .source_line = std::string(source_line(input, offset)),
    };
    error.message = fmt::format("Expected {} but {} found.", describe_expected(error.expected),
                                describe_found(error.found));
    return error;
}

}  // namespace csvjson::parser
