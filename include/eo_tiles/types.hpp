// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the tile
// registry (tile identifiers, mission selection, AOI corner conventions).

#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace eo_tiles {

/**
 * @brief Mission grid-cell code, e.g. an MGRS tile ("31TGM") or a WRS-2
 *        path/row pair ("013033").
 */
using TileId = std::string;

/**
 * @brief Ordered collection of tile identifiers.
 */
using TileIdSet = std::set<TileId>;

/**
 * @brief Ordered sequence of tile identifiers.
 */
using TileIdList = std::vector<TileId>;

/**
 * @brief Identifies which mission grid a registry models.
 */
enum class Mission {
    Sentinel2,  /**< Sentinel-2 MGRS 100 km tiles. */
    Landsat8    /**< Landsat-8 WRS-2 path/row scenes. */
};

/**
 * @brief Selects how an area of interest is built from upper-left and
 *        lower-right corners.
 */
enum class CornerConvention {
    Literal,   /**< Rectangle(ulx, uly, ulx - lrx, uly - lry), as historically stored. */
    Corrected  /**< Rectangle(ulx, lry, lrx - ulx, uly - lry), the area spanned by the corners. */
};

/** @brief Lowercase mission name used in logs and configuration. */
[[nodiscard]] std::string_view to_string(Mission mission) noexcept;

/** @brief Lowercase convention name used in logs and configuration. */
[[nodiscard]] std::string_view to_string(CornerConvention convention) noexcept;

}  // namespace eo_tiles
