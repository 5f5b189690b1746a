#include "eo_tiles/landsat8_tile_registry.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "eo_tiles/errors.hpp"

namespace eo_tiles {

namespace {
constexpr int k_max_wrs2_path{233};
constexpr int k_max_wrs2_row{248};

std::optional<int> parse_index(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char digit) { return std::isdigit(digit); })) {
        return std::nullopt;
    }
    try {
        return std::stoi(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::string> extended_value(const KmlPlacemark& placemark, std::string_view key) {
    for (const auto& [name, value] : placemark.extended_data) {
        const bool matches = name.size() == key.size()
            && std::equal(name.begin(), name.end(), key.begin(), [](char lhs, char rhs) {
                   return std::toupper(static_cast<unsigned char>(lhs)) == std::toupper(static_cast<unsigned char>(rhs));
               });
        if (matches) {
            return value;
        }
    }
    return std::nullopt;
}

// Matches "PATH: 13", "<b>PATH</b> = 13" and similar labels in WRS-2 descriptions.
const std::regex k_description_path{R"(\bPATH\b[^0-9]{0,40}?([0-9]+))", std::regex::icase};
const std::regex k_description_row{R"(\bROW\b[^0-9]{0,40}?([0-9]+))", std::regex::icase};

std::optional<int> description_index(const std::string& description, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(description, match, pattern)) {
        return std::nullopt;
    }
    return parse_index(match[1].str());
}

WrsPathRow path_row_of(const KmlPlacemark& placemark) {
    std::optional<int> path;
    std::optional<int> row;

    const auto str_path = extended_value(placemark, "PATH");
    const auto str_row = extended_value(placemark, "ROW");
    if (str_path && str_row) {
        path = parse_index(*str_path);
        row = parse_index(*str_row);
    } else if (const auto separator = placemark.name.find('_'); separator != std::string::npos) {
        path = parse_index(placemark.name.substr(0, separator));
        row = parse_index(placemark.name.substr(separator + 1));
    } else {
        path = description_index(placemark.description, k_description_path);
        row = description_index(placemark.description, k_description_row);
    }

    if (!path || !row) {
        throw ParseError(fmt::format("placemark '{}' does not carry a WRS-2 path and row", placemark.name));
    }
    return WrsPathRow{*path, *row};
}
}  // namespace

Mission Landsat8TileRegistry::mission() const noexcept {
    return Mission::Landsat8;
}

TileId Landsat8TileRegistry::make_tile_id(WrsPathRow path_row) {
    if (path_row.path < 1 || path_row.path > k_max_wrs2_path) {
        throw std::out_of_range(fmt::format("WRS-2 path {} outside 1-{}", path_row.path, k_max_wrs2_path));
    }
    if (path_row.row < 1 || path_row.row > k_max_wrs2_row) {
        throw std::out_of_range(fmt::format("WRS-2 row {} outside 1-{}", path_row.row, k_max_wrs2_row));
    }
    return fmt::format("{:03}{:03}", path_row.path, path_row.row);
}

void Landsat8TileRegistry::extract_tiles(const std::vector<KmlPlacemark>& placemarks, TileMap& staged_tiles) const {
    for (const KmlPlacemark& placemark : placemarks) {
        TileId tile_id;
        try {
            tile_id = make_tile_id(path_row_of(placemark));
        } catch (const std::out_of_range& error) {
            throw ParseError(fmt::format("placemark '{}': {}", placemark.name, error.what()));
        }
        const std::optional<Rectangle> envelope = eo_tiles::bounding_box(placemark.polygon_envelopes);
        if (!envelope) {
            logger()->debug("Skipping Landsat-8 placemark {} without polygons", tile_id);
            continue;
        }
        staged_tiles.insert_or_assign(std::move(tile_id), *envelope);
    }
}

}  // namespace eo_tiles
