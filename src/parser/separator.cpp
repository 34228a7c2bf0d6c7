#include <csvjson/parser/separator.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace csvjson::parser {

auto detect_separator(std::string_view text) -> std::optional<char> {
    std::optional<char> best;
    std::size_t best_count = 0;
    for (char candidate : kCandidateSeparators) {
        const auto count = static_cast<std::size_t>(std::count(text.begin(), text.end(), candidate));
        spdlog::trace("separator candidate {}: {} occurrences", separator_name(candidate), count);
        if (count > best_count) {
            best = candidate;
            best_count = count;
        }
    }
    return best;
}

auto separator_name(char separator) -> std::string {
    switch (separator) {
        case ',':
            return "comma";
        case ';':
            return "semicolon";
        case '\t':
            return "tab";
        default:
            break;
    }
    const auto byte = static_cast<unsigned char>(separator);
    if (std::isprint(byte) == 0) {
        return fmt::format("'\\x{:02X}'", byte);
    }
    return fmt::format("'{}'", separator);
}

}  // namespace csvjson::parser
