#include "eo_tiles/tile_registry.hpp"

#include <fstream>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "eo_tiles/errors.hpp"
#include "eo_tiles/tile_map_format.hpp"

namespace eo_tiles {

template <typename TileIdRange>
std::optional<Rectangle> TileRegistry::accumulate_bounding_box(const TileIdRange& tile_ids) const {
    std::optional<Rectangle> accumulator;
    for (const TileId& tile_id : tile_ids) {
        const auto iterator_tile = map_tiles_.find(tile_id);
        if (iterator_tile == map_tiles_.end()) {
            continue;
        }
        accumulator = accumulator ? make_union(*accumulator, iterator_tile->second) : iterator_tile->second;
    }
    return accumulator;
}

TileRegistry::TileRegistry()
    : logger_(get_logger()) {}

void TileRegistry::read(std::istream& input) {
    TileMap staged_tiles;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::optional<TileEntry> entry = parse_tile_line(line, line_number);
        if (!entry) {
            continue;
        }
        staged_tiles.insert_or_assign(std::move(entry->tile_id), entry->rectangle);
    }
    if (input.bad()) {
        throw IoError(fmt::format("Failed to read tile map after line {}", line_number));
    }

    const std::size_t staged_count = staged_tiles.size();
    merge(std::move(staged_tiles));
    logger_->info("Read {} {} tiles from {} lines; registry holds {}", staged_count, to_string(mission()), line_number, map_tiles_.size());
}

void TileRegistry::read_file(const std::filesystem::path& tile_map_path) {
    std::ifstream input{tile_map_path};
    if (!input) {
        throw IoError("Unable to open tile map " + tile_map_path.string());
    }
    read(input);
}

void TileRegistry::write(const std::filesystem::path& destination) const {
    std::ofstream output{destination, std::ios::out | std::ios::trunc};
    if (!output) {
        throw IoError("Unable to open " + destination.string() + " for writing");
    }
    for (const auto& [tile_id, rectangle] : map_tiles_) {
        output << format_tile_line(tile_id, rectangle);
        output.flush();
        if (!output) {
            throw IoError("Failed writing tile " + tile_id + " to " + destination.string());
        }
    }
    output.close();
    if (!output) {
        throw IoError("Failed to close " + destination.string());
    }
    logger_->info("Wrote {} tiles to {}", map_tiles_.size(), destination.string());
}

void TileRegistry::ingest_from_file(const std::filesystem::path& kml_path) {
    std::error_code error_status;
    const std::filesystem::file_status status = std::filesystem::status(kml_path, error_status);
    if (status.type() == std::filesystem::file_type::not_found) {
        logger_->debug("KML file {} does not exist; nothing to ingest", kml_path.string());
        return;
    }
    if (error_status) {
        throw IoError("Unable to inspect KML file " + kml_path.string() + ": " + error_status.message());
    }
    std::ifstream kml_stream{kml_path, std::ios::in | std::ios::binary};
    if (!kml_stream) {
        throw IoError("Unable to open KML file " + kml_path.string());
    }
    ingest_from_kml(kml_stream);
}

void TileRegistry::ingest_from_kml(std::istream& kml_stream) {
    const std::vector<KmlPlacemark> list_placemarks = read_kml_placemarks(kml_stream);

    TileMap staged_tiles;
    extract_tiles(list_placemarks, staged_tiles);

    const std::size_t staged_count = staged_tiles.size();
    merge(std::move(staged_tiles));
    logger_->info("Ingested {} {} tiles from {} placemarks; registry holds {}",
                  staged_count,
                  to_string(mission()),
                  list_placemarks.size(),
                  map_tiles_.size());
}

TileIdList TileRegistry::tile_names() const {
    TileIdList list_names;
    list_names.reserve(map_tiles_.size());
    for (const auto& [tile_id, rectangle] : map_tiles_) {
        list_names.push_back(tile_id);
    }
    return list_names;
}

std::size_t TileRegistry::count() const noexcept {
    return map_tiles_.size();
}

std::optional<Rectangle> TileRegistry::find(const TileId& tile_id) const {
    const auto iterator_tile = map_tiles_.find(tile_id);
    if (iterator_tile == map_tiles_.end()) {
        return std::nullopt;
    }
    return iterator_tile->second;
}

std::optional<Rectangle> TileRegistry::bounding_box(const TileIdSet& tile_ids) const {
    return accumulate_bounding_box(tile_ids);
}

std::optional<Rectangle> TileRegistry::bounding_box(const TileIdList& tile_ids) const {
    return accumulate_bounding_box(tile_ids);
}

TileIdSet TileRegistry::intersecting_tiles(const Rectangle& area_of_interest) const {
    TileIdSet set_tiles;
    for (const auto& [tile_id, rectangle] : map_tiles_) {
        if (intersects(rectangle, area_of_interest)) {
            set_tiles.insert(tile_id);
        }
    }
    return set_tiles;
}

TileIdSet TileRegistry::intersecting_tiles(double ulx, double uly, double lrx, double lry, CornerConvention convention) const {
    const Rectangle area_of_interest = rectangle_from_corners(ulx, uly, lrx, lry, convention);
    if (area_of_interest.is_empty()) {
        logger_->debug("AOI ({}, {}) - ({}, {}) is empty under the {} corner convention",
                       ulx, uly, lrx, lry, to_string(convention));
    }
    return intersecting_tiles(area_of_interest);
}

const std::shared_ptr<spdlog::logger>& TileRegistry::logger() const noexcept {
    return logger_;
}

void TileRegistry::merge(TileMap&& staged_tiles) {
    for (auto& [tile_id, rectangle] : staged_tiles) {
        map_tiles_.insert_or_assign(tile_id, rectangle);
    }
}

}  // namespace eo_tiles
