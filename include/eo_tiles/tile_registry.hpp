// === Tile Registry ===========================================================
//
// Owns the mapping from mission tile identifiers to their bounding rectangles.
// A registry is populated from a persisted tile map (read) or from the
// mission's KML grid definition (ingest_from_kml) and then answers two
// geometry queries: the bounding box of a tile subset and the tiles that
// intersect an area of interest.
//
// Mission variants only decide how KML placemarks become tiles; persistence
// and queries are shared. Both population paths stage their results and only
// merge them into the registry once the whole input has been accepted, so a
// failed call leaves the registry as it was.

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "eo_tiles/geometry.hpp"
#include "eo_tiles/kml_document.hpp"
#include "eo_tiles/logging.hpp"
#include "eo_tiles/types.hpp"

namespace eo_tiles {

/** @brief Sorted tile identifier to rectangle mapping. */
using TileMap = std::map<TileId, Rectangle>;

/** @brief Mission-agnostic tile registry; subclasses supply the KML rule. */
class TileRegistry {
  public:
    virtual ~TileRegistry() = default;

    TileRegistry(const TileRegistry&) = delete;
    TileRegistry& operator=(const TileRegistry&) = delete;

    /** @brief Grid this registry models. */
    [[nodiscard]] virtual Mission mission() const noexcept = 0;

    /**
     * @brief Load tiles from a tile map stream.
     *
     * Duplicate identifiers overwrite earlier entries. Throws ParseError on
     * the first malformed line and IoError when the stream fails; in both
     * cases the registry is unchanged.
     */
    void read(std::istream& input);
    /** @brief Open @p tile_map_path and read() it. */
    void read_file(const std::filesystem::path& tile_map_path);
    /** @brief Write every tile in identifier order, truncating @p destination. */
    void write(const std::filesystem::path& destination) const;

    /** @brief Ingest a KML grid definition; a missing file is ignored. */
    void ingest_from_file(const std::filesystem::path& kml_path);
    /**
     * @brief Ingest every tile the mission rule extracts from @p kml_stream.
     *
     * Throws ParseError for malformed XML or a placemark the mission rejects;
     * the registry is then unchanged.
     */
    void ingest_from_kml(std::istream& kml_stream);

    /** @brief Snapshot of tile identifiers in sorted order. */
    [[nodiscard]] TileIdList tile_names() const;
    /** @brief Number of registered tiles. */
    [[nodiscard]] std::size_t count() const noexcept;
    /** @brief Rectangle registered for @p tile_id, if any. */
    [[nodiscard]] std::optional<Rectangle> find(const TileId& tile_id) const;

    /**
     * @brief Union of the rectangles of the registered tiles in @p tile_ids.
     *
     * Unknown identifiers are skipped. Returns nullopt when @p tile_ids is
     * empty or none of them is registered.
     */
    [[nodiscard]] std::optional<Rectangle> bounding_box(const TileIdSet& tile_ids) const;
    [[nodiscard]] std::optional<Rectangle> bounding_box(const TileIdList& tile_ids) const;

    /** @brief Tiles whose rectangle overlaps @p area_of_interest with non-zero area. */
    [[nodiscard]] TileIdSet intersecting_tiles(const Rectangle& area_of_interest) const;
    /** @brief Corner-based overload; see rectangle_from_corners(). */
    [[nodiscard]] TileIdSet intersecting_tiles(double ulx,
                                               double uly,
                                               double lrx,
                                               double lry,
                                               CornerConvention convention = CornerConvention::Literal) const;

  protected:
    TileRegistry();

    /**
     * @brief Mission rule: turn parsed placemarks into tiles.
     *
     * Implementations insert into @p staged_tiles (last one wins) and throw
     * ParseError for placemarks that violate the mission's naming rule.
     */
    virtual void extract_tiles(const std::vector<KmlPlacemark>& placemarks, TileMap& staged_tiles) const = 0;

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept;

  private:
    template <typename TileIdRange>
    std::optional<Rectangle> accumulate_bounding_box(const TileIdRange& tile_ids) const;

    void merge(TileMap&& staged_tiles);

    TileMap map_tiles_;
    std::shared_ptr<spdlog::logger> logger_;
};

using TileRegistryPtr = std::unique_ptr<TileRegistry>;

}  // namespace eo_tiles
