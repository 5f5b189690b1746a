#include "eo_tiles/tile_registry_factory.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

#include "eo_tiles/landsat8_tile_registry.hpp"
#include "eo_tiles/sentinel2_tile_registry.hpp"

namespace eo_tiles {

/**
 * @brief Build the registry variant for the requested mission.
 */
TileRegistryPtr make_tile_registry(Mission mission) {
    switch (mission) {
        case Mission::Sentinel2:
            return std::make_unique<Sentinel2TileRegistry>();
        case Mission::Landsat8:
            return std::make_unique<Landsat8TileRegistry>();
        default:
            throw std::runtime_error("Unsupported mission");
    }
}

std::optional<Mission> parse_mission(std::string_view name) {
    std::string str_name{name};
    std::transform(str_name.begin(), str_name.end(), str_name.begin(), [](unsigned char letter) {
        return static_cast<char>(std::tolower(letter));
    });
    str_name.erase(std::remove(str_name.begin(), str_name.end(), '-'), str_name.end());

    if (str_name == "sentinel2" || str_name == "s2") {
        return Mission::Sentinel2;
    }
    if (str_name == "landsat8" || str_name == "l8") {
        return Mission::Landsat8;
    }
    return std::nullopt;
}

}  // namespace eo_tiles
