#include <csvjson/convert.hpp>
#include <csvjson/parser/parser.hpp>
#include <csvjson/parser/separator.hpp>
#include <csvjson/table/header.hpp>
#include <csvjson/table/records.hpp>
#include <csvjson/table/transpose.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <span>
#include <utility>

namespace csvjson {

namespace {

constexpr std::string_view kErrorEmpty = "Empty CSV. Please provide something.";
constexpr std::string_view kErrorDetectingSeparator = "We could not detect the separator.";
constexpr std::string_view kErrorNotWellFormed = "CSV is not well formed.";
constexpr std::string_view kErrorEmptyHeader =
    "Could not detect header. Ensure first row contains your column headers.";

auto make_error(ErrorKind kind, std::string message) -> ConvertError {
    return ConvertError{.kind = kind, .message = std::move(message), .syntax = std::nullopt};
}

auto resolve_separator(std::string_view text, const Options& options)
    -> std::expected<char, ConvertError> {
    if (options.separator.has_value()) {
        const char separator = *options.separator;
        if (!parser::is_valid_separator(separator)) {
            return std::unexpected(make_error(
                ErrorKind::InvalidSeparator,
                fmt::format("Separator {} cannot be used to delimit fields.",
                            parser::separator_name(separator))));
        }
        spdlog::debug("using explicit separator {}", parser::separator_name(separator));
        return separator;
    }
    auto detected = parser::detect_separator(text);
    if (!detected.has_value()) {
        return std::unexpected(
            make_error(ErrorKind::SeparatorUndetectable, std::string(kErrorDetectingSeparator)));
    }
    spdlog::debug("detected separator {}", parser::separator_name(*detected));
    return *detected;
}

}  // namespace

auto ConvertError::format() const -> std::string {
    if (!syntax.has_value()) {
        return message;
    }
    return fmt::format("{} {}", message, syntax->format());
}

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::InputEmpty:
            return "InputEmpty";
        case ErrorKind::SeparatorUndetectable:
            return "SeparatorUndetectable";
        case ErrorKind::InvalidSeparator:
            return "InvalidSeparator";
        case ErrorKind::EmptyHeader:
            return "EmptyHeader";
        case ErrorKind::SyntaxError:
            return "SyntaxError";
    }
    return "Unknown";
}

auto convert(std::string_view text, const Options& options) -> ConvertResult {
    if (text.empty()) {
        return std::unexpected(make_error(ErrorKind::InputEmpty, std::string(kErrorEmpty)));
    }

    auto separator = resolve_separator(text, options);
    if (!separator.has_value()) {
        return std::unexpected(std::move(separator.error()));
    }

    auto parsed = parser::parse(text, *separator);
    if (!parsed.has_value()) {
        spdlog::debug("parse failed at offset {} (line {}, column {}): {}", parsed.error().offset,
                      parsed.error().line, parsed.error().column, parsed.error().message);
        return std::unexpected(ConvertError{
            .kind = ErrorKind::SyntaxError,
            .message = std::string(kErrorNotWellFormed),
            .syntax = std::move(parsed.error()),
        });
    }
    RawTable table = std::move(*parsed);
    spdlog::debug("parsed {} rows", table.size());

    if (options.transpose) {
        table = table::transpose(table);
    }
    if (options.return_array) {
        return Output{std::move(table)};
    }

    if (table.empty() || table.front().empty()) {
        return std::unexpected(make_error(ErrorKind::EmptyHeader, std::string(kErrorEmptyHeader)));
    }
    const auto keys = table::extract_header(table.front());
    const auto rows = std::span<const Row>(table).subspan(1);
    const table::MapOptions map_options{
        .parse_numbers = options.parse_numbers,
        .parse_json = options.parse_json,
    };

    if (options.hash) {
        return Output{table::map_keyed_records(keys, rows, map_options)};
    }
    return Output{table::map_records(keys, rows, map_options)};
}

}  // namespace csvjson
