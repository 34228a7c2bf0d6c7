#include <csvjson/convert.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

namespace {

using namespace csvjson;

auto require_list(const ConvertResult& result) -> const RecordList& {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    const auto* list = std::get_if<RecordList>(&*result);
    REQUIRE(list != nullptr);
    return *list;
}

auto require_map(const ConvertResult& result) -> const RecordMap& {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    const auto* map = std::get_if<RecordMap>(&*result);
    REQUIRE(map != nullptr);
    return *map;
}

auto require_raw(const ConvertResult& result) -> const RawTable& {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    const auto* raw = std::get_if<RawTable>(&*result);
    REQUIRE(raw != nullptr);
    return *raw;
}

auto require_error(const ConvertResult& result, ErrorKind kind) -> const ConvertError& {
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == kind);
    return result.error();
}

}  // namespace

TEST_CASE("Convert rectangular CSV into records") {
    auto result = convert("name,qty,price\napple,3,1.5\npear,10,0.25\nfig,0,2\n");
    const auto& records = require_list(result);
    REQUIRE(records.size() == 3);
    for (const auto& record : records) {
        REQUIRE(record.size() == 3);
    }
    REQUIRE(records[0]["name"] == "apple");
    REQUIRE(records[1]["qty"] == "10");
    REQUIRE(records[2]["price"] == "2");
}

TEST_CASE("Convert detects semicolons") {
    auto result = convert("a;b\n1,5;2\n");
    const auto& records = require_list(result);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["a"] == "1,5");
    REQUIRE(records[0]["b"] == "2");
}

TEST_CASE("Convert detects tabs") {
    auto result = convert("a\tb\nx\ty\n");
    REQUIRE(require_list(result)[0]["b"] == "y");
}

TEST_CASE("Convert honors an explicit separator") {
    auto result = convert("a|b\n1,2|3\n", Options{.separator = '|'});
    const auto& records = require_list(result);
    REQUIRE(records[0]["a"] == "1,2");
    REQUIRE(records[0]["b"] == "3");
}

TEST_CASE("Convert parses numbers on request") {
    auto result = convert("id,v\nx,42\ny,42a\nz,\n", Options{.parse_numbers = true});
    const auto& records = require_list(result);
    REQUIRE(records[0]["v"] == 42);
    REQUIRE(records[1]["v"] == "42a");
    REQUIRE(records[2]["v"] == "");
}

TEST_CASE("Convert parses JSON literals on request") {
    auto result = convert("a;b;c;d\ntrue;null;[1,2];{\"k\":1}\n", Options{.parse_json = true});
    const auto& records = require_list(result);
    REQUIRE(records[0]["a"] == true);
    REQUIRE(records[0]["b"].is_null());
    REQUIRE(records[0]["c"].is_array());
    REQUIRE(records[0]["d"]["k"] == 1);
}

TEST_CASE("Convert de-duplicates headers") {
    auto result = convert("x,x,x\n1,2,3\n");
    const auto& records = require_list(result);
    REQUIRE(records[0]["x__2"] == "1");
    REQUIRE(records[0]["x__1"] == "2");
    REQUIRE(records[0]["x"] == "3");
}

TEST_CASE("Convert strips quotes and whitespace around values") {
    auto result = convert(" \"h\" , k \n \"v\" , w \n");
    const auto& records = require_list(result);
    REQUIRE(records[0]["h"] == "v");
    REQUIRE(records[0]["k"] == "w");
}

TEST_CASE("Convert tolerates ragged rows") {
    auto result = convert("a,b,c\n1\n1,2,3,4\n");
    const auto& records = require_list(result);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["c"] == "");
    REQUIRE(records[1].size() == 3);
}

TEST_CASE("Convert in hash mode keys by first column") {
    auto result = convert("id,v\nk1,10\nk1,20\n", Options{.hash = true});
    const auto& records = require_map(result);
    REQUIRE(records.size() == 1);
    REQUIRE(records.at("k1").size() == 1);
    REQUIRE(records.at("k1")["v"] == "20");
}

TEST_CASE("Convert transposes before reading the header") {
    auto result = convert("name,a,b\nage,1,2\n", Options{.transpose = true});
    const auto& records = require_list(result);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["name"] == "a");
    REQUIRE(records[1]["age"] == "2");
}

TEST_CASE("Convert returns the raw matrix on request") {
    auto result = convert("a,\"b,c\"\n1\n", Options{.return_array = true});
    const auto& raw = require_raw(result);
    REQUIRE(raw == RawTable{{"a", "b,c"}, {"1"}});
}

TEST_CASE("Raw matrix after transpose keeps missing cells") {
    auto result = convert("a,b\n1\n", Options{.transpose = true, .return_array = true});
    const auto& raw = require_raw(result);
    REQUIRE(raw.size() == 2);
    REQUIRE(raw[1][0] == std::string("b"));
    REQUIRE_FALSE(raw[1][1].has_value());
}

TEST_CASE("Empty input is rejected") {
    auto result = convert("");
    const auto& error = require_error(result, ErrorKind::InputEmpty);
    REQUIRE(error.message == "Empty CSV. Please provide something.");
    REQUIRE_FALSE(error.syntax.has_value());
}

TEST_CASE("Undetectable separator is rejected") {
    auto result = convert("just words\nmore words");
    const auto& error = require_error(result, ErrorKind::SeparatorUndetectable);
    REQUIRE(error.format() == "We could not detect the separator.");
}

TEST_CASE("Explicit separator skips detection") {
    auto result = convert("only\nvalue\n", Options{.separator = ','});
    const auto& records = require_list(result);
    REQUIRE(records[0]["only"] == "value");
}

TEST_CASE("Quote and line break separators are rejected") {
    require_error(convert("a,b", Options{.separator = '"'}), ErrorKind::InvalidSeparator);
    require_error(convert("a,b", Options{.separator = '\n'}), ErrorKind::InvalidSeparator);
}

TEST_CASE("Unterminated quote is a syntax error at the missing quote") {
    const std::string text = "a,b\n1,\"open\n2,3";
    auto result = convert(text);
    const auto& error = require_error(result, ErrorKind::SyntaxError);
    REQUIRE(error.syntax.has_value());
    REQUIRE(error.syntax->offset == text.size());
    REQUIRE(error.syntax->line == 3);
    REQUIRE(error.syntax->column == 4);
    REQUIRE(error.format() ==
            "CSV is not well formed. Expected '\"' or quoted character but end of input "
            "found. On line 3 and column 4.\n2,3");
}

TEST_CASE("Syntax errors win over header checks in raw mode") {
    require_error(convert("\"x\"y,z", Options{.return_array = true}), ErrorKind::SyntaxError);
}

TEST_CASE("Header row with a single empty field is allowed") {
    auto result = convert("\"\"\n1\n", Options{.separator = ','});
    const auto& records = require_list(result);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0][""] == "1");
}

TEST_CASE("Error kinds have stable names") {
    REQUIRE(to_string(ErrorKind::InputEmpty) == "InputEmpty");
    REQUIRE(to_string(ErrorKind::SyntaxError) == "SyntaxError");
}
