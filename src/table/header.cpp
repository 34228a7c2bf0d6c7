#include <csvjson/table/header.hpp>

#include <fmt/core.h>
#include <robin_hood.h>

#include <utility>

namespace csvjson::table {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto clean_cell(const Cell& cell) -> std::string {
    if (!cell.has_value()) {
        return {};
    }
    auto text = trim(*cell);
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        text = text.substr(1, text.size() - 2);
    }
    return std::string(text);
}

auto uniquify(std::vector<std::string> keys) -> std::vector<std::string> {
    // Number of occurrences beyond the first, i.e. how many suffixes remain.
    robin_hood::unordered_flat_map<std::string, std::size_t> repeats;
    for (const auto& key : keys) {
        auto [it, inserted] = repeats.try_emplace(key, 0);
        if (!inserted) {
            it->second += 1;
        }
    }

    // Counting down from the left leaves the rightmost occurrence unsuffixed.
    for (auto& key : keys) {
        auto& remaining = repeats[key];
        if (remaining > 0) {
            key = fmt::format("{}{}{}", key, kDuplicateSuffix, remaining);
            remaining -= 1;
        }
    }
    return keys;
}

auto extract_header(const Row& row) -> std::vector<std::string> {
    std::vector<std::string> keys;
    keys.reserve(row.size());
    for (const auto& cell : row) {
        keys.push_back(clean_cell(cell));
    }
    return uniquify(std::move(keys));
}

}  // namespace csvjson::table
