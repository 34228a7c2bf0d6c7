#include <csvjson/table/transpose.hpp>

#include <algorithm>

namespace csvjson::table {

auto transpose(const RawTable& table) -> RawTable {
    std::size_t width = 0;
    for (const auto& row : table) {
        width = std::max(width, row.size());
    }

    RawTable result(width);
    for (auto& column : result) {
        column.reserve(table.size());
    }
    for (const auto& row : table) {
        for (std::size_t i = 0; i < width; ++i) {
            result[i].push_back(i < row.size() ? row[i] : Cell{});
        }
    }
    return result;
}

}  // namespace csvjson::table
