// === Configuration ===========================================================
//
// Exposes the strongly-typed settings consumed by the tile tool: which mission
// grid to build, which tile map and KML inputs to load, where to write the
// result and which area of interest to query. `ConfigurationLoader` translates
// environment variables into these structures so downstream code never
// touches `std::getenv` directly.

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "eo_tiles/types.hpp"

namespace eo_tiles {

/** @brief Area of interest as upper-left and lower-right corners in degrees. */
struct AoiCorners final {
    double ulx{};  /**< Upper-left longitude. */
    double uly{};  /**< Upper-left latitude. */
    double lrx{};  /**< Lower-right longitude. */
    double lry{};  /**< Lower-right latitude. */
};

/**
 * @brief Immutable bundle of runtime knobs for the tile tool.
 *
 * Every field is populated by ConfigurationLoader; optional paths are unset
 * when the matching variable is absent or empty.
 */
struct Configuration final {
    std::string log_directory{};                         /**< Destination directory for structured logs. */
    std::string log_level{};                             /**< spdlog level name. */
    Mission mission{Mission::Sentinel2};                 /**< Grid the registry models. */
    std::optional<std::filesystem::path> tile_map_path;  /**< Existing tile map loaded first. */
    std::optional<std::filesystem::path> kml_path;       /**< Grid KML ingested after the tile map. */
    std::optional<std::filesystem::path> output_path;    /**< Tile map written after loading. */
    std::optional<AoiCorners> area_of_interest;          /**< Corners of the AOI to query. */
    CornerConvention corner_convention{CornerConvention::Literal}; /**< How AOI corners become a rectangle. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

    /** @brief Parse "ulx,uly,lrx,lry"; nullopt when malformed. */
    static std::optional<AoiCorners> parse_area_of_interest(const std::string& raw_value);

  private:
    static Mission load_mission();
    static CornerConvention load_corner_convention();
    static std::optional<AoiCorners> load_area_of_interest();
};

}  // namespace eo_tiles
