#include <cstdlib>
#include <iostream>

#include "eo_tiles/configuration.hpp"
#include "eo_tiles/geometry.hpp"
#include "eo_tiles/logging.hpp"
#include "eo_tiles/tile_registry_factory.hpp"
#include "eo_tiles/version.hpp"

int main() {
    using namespace eo_tiles;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto logger = get_logger();
        logger->info("eo_tiles_tool {} starting for {}", k_version, to_string(configuration.mission));

        TileRegistryPtr registry = make_tile_registry(configuration.mission);
        if (configuration.tile_map_path) {
            registry->read_file(*configuration.tile_map_path);
        }
        if (configuration.kml_path) {
            registry->ingest_from_file(*configuration.kml_path);
        }
        logger->info("Registry holds {} tiles", registry->count());

        if (configuration.output_path) {
            registry->write(*configuration.output_path);
        }

        if (configuration.area_of_interest) {
            const AoiCorners& corners = *configuration.area_of_interest;
            const TileIdSet set_tiles = registry->intersecting_tiles(
                corners.ulx, corners.uly, corners.lrx, corners.lry, configuration.corner_convention);
            for (const TileId& tile_id : set_tiles) {
                std::cout << tile_id << '\n';
            }

            const auto extent = registry->bounding_box(set_tiles);
            if (extent) {
                logger->info("{} tiles intersect the AOI; combined extent x={} y={} w={} h={}",
                             set_tiles.size(), extent->x, extent->y, extent->width, extent->height);
            } else {
                logger->info("No tiles intersect the AOI");
            }
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
