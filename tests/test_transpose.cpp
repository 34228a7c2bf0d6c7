#include <csvjson/table/transpose.hpp>

#include <catch2/catch_test_macros.hpp>

using csvjson::Cell;
using csvjson::RawTable;
using csvjson::table::transpose;

TEST_CASE("Transpose rectangular table") {
    const RawTable table = {{"a", "b", "c"}, {"1", "2", "3"}};
    const RawTable expected = {{"a", "1"}, {"b", "2"}, {"c", "3"}};
    REQUIRE(transpose(table) == expected);
}

TEST_CASE("Transpose pads ragged rows with missing cells") {
    const RawTable table = {{"a"}, {"1", "2", "3"}, {"x", "y"}};
    const auto result = transpose(table);
    REQUIRE(result.size() == 3);
    REQUIRE(result[0] == csvjson::Row{"a", "1", "x"});
    REQUIRE(result[1] == csvjson::Row{Cell{}, "2", "y"});
    REQUIRE(result[2] == csvjson::Row{Cell{}, "3", Cell{}});
}

TEST_CASE("Missing cells differ from empty cells") {
    const RawTable table = {{"a", ""}, {"b"}};
    const auto result = transpose(table);
    REQUIRE(result[1][0] == std::string(""));
    REQUIRE_FALSE(result[1][1].has_value());
}

TEST_CASE("Transpose of empty table is empty") {
    REQUIRE(transpose(RawTable{}).empty());
}

TEST_CASE("Transpose twice restores a rectangular table") {
    const RawTable table = {{"h1", "h2"}, {"1", "2"}, {"3", "4"}};
    REQUIRE(transpose(transpose(table)) == table);
}
