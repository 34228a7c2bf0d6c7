#include <csvjson/table/header.hpp>
#include <csvjson/table/records.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iterator>
#include <utility>

namespace csvjson::table {

namespace {

auto cell_at(const Row& row, std::size_t index) -> std::string {
    if (index >= row.size()) {
        return {};
    }
    return clean_cell(row[index]);
}

// Record fields in first-appearance order, and the field each column feeds.
// Repeated keys share one field; the rightmost column's value wins.
struct FieldLayout {
    std::vector<std::string> names;
    std::vector<std::size_t> field_of_column;
};

auto make_layout(const std::vector<std::string>& keys, std::size_t first) -> FieldLayout {
    FieldLayout layout;
    robin_hood::unordered_flat_map<std::string, std::size_t> index;
    for (std::size_t i = first; i < keys.size(); ++i) {
        auto [it, inserted] = index.try_emplace(keys[i], layout.names.size());
        if (inserted) {
            layout.names.push_back(keys[i]);
        }
        layout.field_of_column.push_back(it->second);
    }
    return layout;
}

auto build_record(const FieldLayout& layout, const Row& row, std::size_t first,
                  const MapOptions& options) -> Record {
    std::vector<Value> values(layout.names.size());
    for (std::size_t column = 0; column < layout.field_of_column.size(); ++column) {
        values[layout.field_of_column[column]] =
            coerce_value(cell_at(row, first + column), options);
    }

    // Append straight to the object storage; keyed insertion scans it.
    Record record = Record::object();
    auto& fields = record.get_ref<Value::object_t&>();
    fields.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        fields.emplace_back(layout.names[i], std::move(values[i]));
    }
    return record;
}

}  // namespace

auto is_numeric(std::string_view text) noexcept -> bool {
    std::size_t i = 0;
    const auto digits = [&]() -> std::size_t {
        const std::size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
        return i - start;
    };

    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
    }
    std::size_t mantissa = digits();
    if (i < text.size() && text[i] == '.') {
        ++i;
        mantissa += digits();
    }
    if (mantissa == 0) {
        return false;
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            ++i;
        }
        if (digits() == 0) {
            return false;
        }
    }
    return i == text.size();
}

auto coerce_value(std::string_view cleaned, const MapOptions& options) -> Value {
    if (options.parse_json || (options.parse_numbers && is_numeric(cleaned))) {
        auto decoded = Value::parse(cleaned, nullptr, /*allow_exceptions=*/false);
        if (!decoded.is_discarded()) {
            return decoded;
        }
    }
    return Value(std::string(cleaned));
}

auto map_records(const std::vector<std::string>& keys, std::span<const Row> rows,
                 const MapOptions& options) -> RecordList {
    const auto layout = make_layout(keys, 0);
    RecordList records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(build_record(layout, row, 0, options));
    }
    return records;
}

auto map_keyed_records(const std::vector<std::string>& keys, std::span<const Row> rows,
                       const MapOptions& options) -> RecordMap {
    const auto layout = make_layout(keys, 1);
    RecordMap records;
    robin_hood::unordered_flat_map<std::string, std::size_t> position;
    for (const auto& row : rows) {
        auto key = cell_at(row, 0);
        auto record = build_record(layout, row, 1, options);
        auto [it, inserted] = position.try_emplace(key, records.size());
        if (!inserted) {
            spdlog::debug("hash key '{}' repeats; keeping the later row", key);
            std::next(records.begin(), static_cast<std::ptrdiff_t>(it->second))->second =
                std::move(record);
            continue;
        }
        records.emplace_back(std::move(key), std::move(record));
    }
    return records;
}

}  // namespace csvjson::table
