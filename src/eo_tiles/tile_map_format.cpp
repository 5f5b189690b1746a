#include "eo_tiles/tile_map_format.hpp"

#include <array>
#include <cstdlib>
#include <vector>

#include <fmt/format.h>

#include "eo_tiles/errors.hpp"

namespace eo_tiles {

namespace {
constexpr std::string_view k_whitespace{" \t\r\n"};
constexpr std::array<std::string_view, 4> k_field_keys{"x=", "y=", "w=", "h="};

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(k_whitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_fields(std::string_view text) {
    std::vector<std::string_view> list_fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            list_fields.push_back(text.substr(start));
            break;
        }
        list_fields.push_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return list_fields;
}

double parse_field(std::string_view token, std::string_view key, std::size_t line_number) {
    const std::string_view field = trim(token);
    if (field.substr(0, key.size()) != key) {
        throw ParseError(fmt::format("expected field '{}' but found '{}'", key.substr(0, 1), field), line_number);
    }
    const std::string str_value{trim(field.substr(key.size()))};
    if (str_value.empty()) {
        throw ParseError(fmt::format("field '{}' has no value", key.substr(0, 1)), line_number);
    }
    const std::optional<double> value = parse_decimal(str_value);
    if (!value) {
        throw ParseError(fmt::format("field '{}' is not a number: '{}'", key.substr(0, 1), str_value), line_number);
    }
    return *value;
}
}  // namespace

std::optional<TileEntry> parse_tile_line(std::string_view line, std::size_t line_number) {
    const std::string_view content = trim(line);
    if (content.empty()) {
        return std::nullopt;
    }

    const auto separator = content.find_first_of(k_whitespace);
    if (separator == std::string_view::npos) {
        throw ParseError(fmt::format("missing space after tile identifier in '{}'", content), line_number);
    }

    const std::string_view tile_id = content.substr(0, separator);
    const std::vector<std::string_view> list_fields = split_fields(trim(content.substr(separator + 1)));
    if (list_fields.size() != k_field_keys.size()) {
        throw ParseError(
            fmt::format("tile {} has {} fields, expected {}", tile_id, list_fields.size(), k_field_keys.size()),
            line_number
        );
    }

    TileEntry entry{};
    entry.tile_id = TileId{tile_id};
    entry.rectangle.x = parse_field(list_fields[0], k_field_keys[0], line_number);
    entry.rectangle.y = parse_field(list_fields[1], k_field_keys[1], line_number);
    entry.rectangle.width = parse_field(list_fields[2], k_field_keys[2], line_number);
    entry.rectangle.height = parse_field(list_fields[3], k_field_keys[3], line_number);
    return entry;
}

std::string format_tile_line(const TileId& tile_id, const Rectangle& rectangle) {
    return fmt::format("{} x={},y={},w={},h={}\n",
                       tile_id,
                       format_coordinate(rectangle.x),
                       format_coordinate(rectangle.y),
                       format_coordinate(rectangle.width),
                       format_coordinate(rectangle.height));
}

std::optional<double> parse_decimal(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    // ERANGE still leaves strtod's rounded result (infinity or a subnormal) in value.
    return value;
}

std::string format_coordinate(double value) {
    std::string str_value = fmt::format("{}", value);
    if (str_value.find_first_of(".eEni") == std::string::npos) {
        str_value += ".0";
    }
    return str_value;
}

}  // namespace eo_tiles
