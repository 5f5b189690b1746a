// === Landsat-8 Tile Registry =================================================
//
// Landsat-8 scenes follow the WRS-2 path/row grid. Placemarks carry the path
// and row as ExtendedData fields (PATH, ROW), in their name as "<path>_<row>",
// or as labelled values in their description; tiles are keyed as the zero-padded "PPPRRR" code used in
// Landsat product identifiers.

#pragma once

#include "eo_tiles/tile_registry.hpp"

namespace eo_tiles {

/** @brief WRS-2 path/row pair. */
struct WrsPathRow final {
    int path{};
    int row{};
};

/** @brief Registry of Landsat-8 WRS-2 scenes. */
class Landsat8TileRegistry final : public TileRegistry {
  public:
    Landsat8TileRegistry() = default;

    [[nodiscard]] Mission mission() const noexcept override;

    /** @brief "PPPRRR" code; throws std::out_of_range outside the WRS-2 grid. */
    [[nodiscard]] static TileId make_tile_id(WrsPathRow path_row);

  protected:
    void extract_tiles(const std::vector<KmlPlacemark>& placemarks, TileMap& staged_tiles) const override;
};

}  // namespace eo_tiles
