#include <csvjson/core/value.hpp>

#include <type_traits>
#include <utility>

namespace csvjson {

namespace {

auto raw_table_to_json(const RawTable& table) -> Value {
    Value rows = Value::array();
    for (const auto& row : table) {
        Value cells = Value::array();
        for (const auto& cell : row) {
            if (cell.has_value()) {
                cells.push_back(*cell);
            } else {
                cells.push_back(nullptr);
            }
        }
        rows.push_back(std::move(cells));
    }
    return rows;
}

}  // namespace

auto to_json(const Output& output) -> Value {
    return std::visit(
        [](const auto& shape) -> Value {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, RecordList>) {
                Value records = Value::array();
                for (const auto& record : shape) {
                    records.push_back(record);
                }
                return records;
            } else if constexpr (std::is_same_v<T, RecordMap>) {
                Value records = Value::object();
                auto& fields = records.get_ref<Value::object_t&>();
                fields.reserve(shape.size());
                for (const auto& [key, record] : shape) {
                    fields.emplace_back(key, record);
                }
                return records;
            } else {
                return raw_table_to_json(shape);
            }
        },
        output);
}

}  // namespace csvjson
