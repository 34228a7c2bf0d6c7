#include <csvjson/parser/parser.hpp>
#include <csvjson/parser/separator.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csvjson::parser {

namespace {

constexpr std::string_view kExpectQuote = "'\"'";
constexpr std::string_view kExpectLineBreak = "line break";
constexpr std::string_view kExpectFieldChar = "field character";
constexpr std::string_view kExpectQuotedChar = "quoted character";

class Parser {
   public:
    Parser(std::string_view input, char separator)
        : input_(input),
          separator_(separator),
          expect_separator_(fmt::format("separator {}", separator_name(separator))) {}

    auto parse_document() -> ParseResult {
        auto table = parse_lines();
        if (!table.has_value() || pos_ != input_.size()) {
            return std::unexpected(
                make_parse_error(input_, std::max(pos_, furthest_),
                                 std::vector<std::string>(expected_.begin(), expected_.end())));
        }
        return std::move(*table);
    }

   private:
    auto parse_lines() -> std::optional<RawTable> {
        const std::size_t start = pos_;
        skip_line_breaks();
        auto first = parse_line();
        if (!first.has_value()) {
            pos_ = start;
            return std::nullopt;
        }

        RawTable table;
        table.push_back(std::move(*first));
        while (true) {
            const std::size_t mark = pos_;
            if (!match_line_break()) {
                break;
            }
            skip_line_breaks();
            auto line = parse_line();
            if (!line.has_value()) {
                pos_ = mark;
                break;
            }
            table.push_back(std::move(*line));
        }
        skip_line_breaks();
        return table;
    }

    auto parse_line() -> std::optional<Row> {
        const std::size_t start = pos_;
        Row row;
        row.emplace_back(parse_field());
        while (match_separator()) {
            row.emplace_back(parse_field());
        }
        // A line that consumed nothing is a blank line, not an empty row.
        if (pos_ == start) {
            return std::nullopt;
        }
        return row;
    }

    auto parse_field() -> std::string {
        if (auto quoted = parse_quoted_field(); quoted.has_value()) {
            return std::move(*quoted);
        }
        return parse_unquoted_field();
    }

    auto parse_quoted_field() -> std::optional<std::string> {
        const std::size_t start = pos_;
        if (!match_char('"', kExpectQuote)) {
            return std::nullopt;
        }
        std::string text;
        while (true) {
            if (match_escaped_quote()) {
                text.push_back('"');
                continue;
            }
            if (pos_ < input_.size() && input_[pos_] != '"') {
                text.push_back(input_[pos_]);
                pos_ += 1;
                continue;
            }
            fail(kExpectQuotedChar);
            break;
        }
        if (!match_char('"', kExpectQuote)) {
            pos_ = start;
            return std::nullopt;
        }
        return text;
    }

    auto parse_unquoted_field() -> std::string {
        const std::size_t start = pos_;
        while (pos_ < input_.size()) {
            const char ch = input_[pos_];
            if (ch == separator_) {
                break;
            }
            if (ch == '\n' || ch == '\r' || (ch == '"' && pos_ == start)) {
                fail(kExpectFieldChar);
                break;
            }
            pos_ += 1;
        }
        if (pos_ == input_.size()) {
            fail(kExpectFieldChar);
        }
        return std::string(input_.substr(start, pos_ - start));
    }

    auto match_escaped_quote() -> bool {
        const std::size_t mark = pos_;
        if (match_char('"', kExpectQuote) && match_char('"', kExpectQuote)) {
            return true;
        }
        pos_ = mark;
        return false;
    }

    auto match_separator() -> bool {
        if (pos_ < input_.size() && input_[pos_] == separator_) {
            pos_ += 1;
            return true;
        }
        fail(expect_separator_);
        return false;
    }

    auto match_line_break() -> bool {
        if (pos_ < input_.size() && (input_[pos_] == '\n' || input_[pos_] == '\r')) {
            pos_ += 1;
            return true;
        }
        fail(kExpectLineBreak);
        return false;
    }

    void skip_line_breaks() {
        while (match_line_break()) {
        }
    }

    auto match_char(char expected, std::string_view description) -> bool {
        if (pos_ < input_.size() && input_[pos_] == expected) {
            pos_ += 1;
            return true;
        }
        fail(description);
        return false;
    }

    /// Record an expectation at the cursor. Only the furthest position keeps
    /// its expectations; backtracking never clears them.
    void fail(std::string_view description) {
        if (pos_ < furthest_) {
            return;
        }
        if (pos_ > furthest_) {
            furthest_ = pos_;
            expected_.clear();
        }
        expected_.push_back(description);
    }

    std::string_view input_;
    char separator_;
    std::string expect_separator_;
    std::size_t pos_ = 0;
    std::size_t furthest_ = 0;
    // Views into the constants above or into expect_separator_.
    std::vector<std::string_view> expected_;
};

}  // namespace

auto parse(std::string_view input, char separator) -> ParseResult {
    Parser parser(input, separator);
    return parser.parse_document();
}

}  // namespace csvjson::parser
