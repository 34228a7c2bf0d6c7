#include <csvjson/csvjson.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

auto main() -> int {
    spdlog::set_level(spdlog::level::debug);

    constexpr std::string_view text =
        "id;name;price;tags\n"
        "1;\"Widget; large\";9.99;[\"tools\",\"home\"]\n"
        "2;Gadget;12;[]\n"
        "2;Gadget v2;14.5;null\n";

    // Cells keep their bytes; replace invalid UTF-8 rather than throw on dump.
    const auto render = [](const csvjson::Output& output) {
        return csvjson::to_json(output).dump(2, ' ', false,
                                             csvjson::Value::error_handler_t::replace);
    };

    // Array of records, with numbers and JSON literals decoded.
    fmt::print("=== records ===\n");
    auto records = csvjson::convert(text, {.parse_json = true});
    if (!records) {
        fmt::print(stderr, "{}\n", records.error().format());
        return 1;
    }
    fmt::print("{}\n", render(*records));

    // Keyed by id: the second "2" row replaces the first.
    fmt::print("\n=== hash ===\n");
    auto keyed = csvjson::convert(text, {.parse_numbers = true, .hash = true});
    if (!keyed) {
        fmt::print(stderr, "{}\n", keyed.error().format());
        return 1;
    }
    fmt::print("{}\n", render(*keyed));

    // Diagnostics for malformed input.
    fmt::print("\n=== error ===\n");
    auto broken = csvjson::convert("a,b\n1,\"unterminated\n");
    if (!broken) {
        fmt::print("{}: {}\n", csvjson::to_string(broken.error().kind), broken.error().format());
    }

    return 0;
}
