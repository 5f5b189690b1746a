#include "eo_tiles/sentinel2_tile_registry.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

#include "eo_tiles/errors.hpp"

namespace eo_tiles {

namespace {
constexpr std::size_t k_mgrs_code_length{5};
constexpr int k_max_utm_zone{60};
constexpr std::string_view k_latitude_bands{"CDEFGHJKLMNPQRSTUVWX"};

bool is_square_letter(char letter) {
    return letter >= 'A' && letter <= 'Z' && letter != 'I' && letter != 'O';
}
}  // namespace

Mission Sentinel2TileRegistry::mission() const noexcept {
    return Mission::Sentinel2;
}

std::optional<TileId> Sentinel2TileRegistry::normalize_tile_id(std::string_view name) {
    std::string code{name};
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char letter) {
        return static_cast<char>(std::toupper(letter));
    });
    if (code.size() == k_mgrs_code_length + 1 && code.front() == 'T') {
        code.erase(0, 1);
    }
    if (code.size() != k_mgrs_code_length) {
        return std::nullopt;
    }
    if (!std::isdigit(static_cast<unsigned char>(code[0])) || !std::isdigit(static_cast<unsigned char>(code[1]))) {
        return std::nullopt;
    }
    const int zone = (code[0] - '0') * 10 + (code[1] - '0');
    if (zone < 1 || zone > k_max_utm_zone) {
        return std::nullopt;
    }
    if (k_latitude_bands.find(code[2]) == std::string_view::npos) {
        return std::nullopt;
    }
    if (!is_square_letter(code[3]) || !is_square_letter(code[4])) {
        return std::nullopt;
    }
    return code;
}

void Sentinel2TileRegistry::extract_tiles(const std::vector<KmlPlacemark>& placemarks, TileMap& staged_tiles) const {
    for (const KmlPlacemark& placemark : placemarks) {
        const std::optional<TileId> tile_id = normalize_tile_id(placemark.name);
        if (!tile_id) {
            throw ParseError(fmt::format("placemark '{}' is not an MGRS tile name", placemark.name));
        }
        const std::optional<Rectangle> envelope = eo_tiles::bounding_box(placemark.polygon_envelopes);
        if (!envelope) {
            logger()->debug("Skipping Sentinel-2 placemark {} without polygons", *tile_id);
            continue;
        }
        staged_tiles.insert_or_assign(*tile_id, *envelope);
    }
}

}  // namespace eo_tiles
