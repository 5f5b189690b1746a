#pragma once

#include <optional>
#include <string_view>

#include "eo_tiles/tile_registry.hpp"
#include "eo_tiles/types.hpp"

namespace eo_tiles {

/** @brief Construct an empty registry for @p mission. */
TileRegistryPtr make_tile_registry(Mission mission);

/** @brief Parse a mission name ("sentinel2", "s2", "landsat8", "l8"), case-insensitively. */
std::optional<Mission> parse_mission(std::string_view name);

}  // namespace eo_tiles
