// === Sentinel-2 Tile Registry ================================================
//
// Sentinel-2 products are distributed on the MGRS 100 km grid. The ESA tiling
// grid KML names each placemark after its MGRS cell ("31TGM") and describes
// its footprint with one or more polygons.

#pragma once

#include <optional>
#include <string_view>

#include "eo_tiles/tile_registry.hpp"

namespace eo_tiles {

/** @brief Registry of Sentinel-2 MGRS tiles. */
class Sentinel2TileRegistry final : public TileRegistry {
  public:
    Sentinel2TileRegistry() = default;

    [[nodiscard]] Mission mission() const noexcept override;

    /**
     * @brief Canonical MGRS code for @p name, or nullopt if it is not one.
     *
     * Accepts an optional leading 'T' and lowercase letters: "t31tgm" gives
     * "31TGM".
     */
    [[nodiscard]] static std::optional<TileId> normalize_tile_id(std::string_view name);

  protected:
    void extract_tiles(const std::vector<KmlPlacemark>& placemarks, TileMap& staged_tiles) const override;
};

}  // namespace eo_tiles
