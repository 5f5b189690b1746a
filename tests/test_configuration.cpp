#include <catch2/catch.hpp>

#include <cstdlib>

#include "logging_test_fixture.hpp"
#include "eo_tiles/configuration.hpp"

using namespace eo_tiles;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    eo_tiles::test::ensure_logger_initialized();
    return true;
}();

constexpr const char* k_variables[] = {
    "EO_TILES_MISSION", "EO_TILES_TILE_MAP", "EO_TILES_KML", "EO_TILES_OUTPUT",
    "EO_TILES_AOI", "EO_TILES_CORNER_CONVENTION", "EO_TILES_LOG_LEVEL",
};

void clear_environment() {
    for (const char* name : k_variables) {
        ::unsetenv(name);
    }
}
}  // namespace

TEST_CASE("ConfigurationLoader falls back to defaults") {
    clear_environment();

    const Configuration config = ConfigurationLoader::load();
    REQUIRE(config.mission == Mission::Sentinel2);
    REQUIRE(config.log_level == "info");
    REQUIRE_FALSE(config.tile_map_path.has_value());
    REQUIRE_FALSE(config.kml_path.has_value());
    REQUIRE_FALSE(config.output_path.has_value());
    REQUIRE_FALSE(config.area_of_interest.has_value());
    REQUIRE(config.corner_convention == CornerConvention::Literal);
}

TEST_CASE("ConfigurationLoader reads tool settings from the environment") {
    clear_environment();
    ::setenv("EO_TILES_MISSION", "L8", 1);
    ::setenv("EO_TILES_TILE_MAP", "/data/l8_tiles.txt", 1);
    ::setenv("EO_TILES_KML", "/data/WRS2_descending.kml", 1);
    ::setenv("EO_TILES_OUTPUT", "/tmp/out.txt", 1);
    ::setenv("EO_TILES_AOI", "-10.5, 45.0, -9.0, 44.25", 1);
    ::setenv("EO_TILES_CORNER_CONVENTION", "corrected", 1);
    ::setenv("EO_TILES_LOG_LEVEL", "debug", 1);

    const Configuration config = ConfigurationLoader::load();
    clear_environment();

    REQUIRE(config.mission == Mission::Landsat8);
    REQUIRE(config.tile_map_path == std::filesystem::path{"/data/l8_tiles.txt"});
    REQUIRE(config.kml_path == std::filesystem::path{"/data/WRS2_descending.kml"});
    REQUIRE(config.output_path == std::filesystem::path{"/tmp/out.txt"});
    REQUIRE(config.log_level == "debug");
    REQUIRE(config.corner_convention == CornerConvention::Corrected);
    REQUIRE(config.area_of_interest.has_value());
    REQUIRE(config.area_of_interest->ulx == -10.5);
    REQUIRE(config.area_of_interest->uly == 45.0);
    REQUIRE(config.area_of_interest->lrx == -9.0);
    REQUIRE(config.area_of_interest->lry == 44.25);
}

TEST_CASE("ConfigurationLoader ignores invalid values") {
    clear_environment();
    ::setenv("EO_TILES_MISSION", "modis", 1);
    ::setenv("EO_TILES_AOI", "1,2,3", 1);
    ::setenv("EO_TILES_CORNER_CONVENTION", "sideways", 1);

    const Configuration config = ConfigurationLoader::load();
    clear_environment();

    REQUIRE(config.mission == Mission::Sentinel2);
    REQUIRE_FALSE(config.area_of_interest.has_value());
    REQUIRE(config.corner_convention == CornerConvention::Literal);
}

TEST_CASE("parse_area_of_interest requires four numbers") {
    REQUIRE(ConfigurationLoader::parse_area_of_interest("1,2,3,4").has_value());
    REQUIRE_FALSE(ConfigurationLoader::parse_area_of_interest("1,2,3").has_value());
    REQUIRE_FALSE(ConfigurationLoader::parse_area_of_interest("1,2,3,4,5").has_value());
    REQUIRE_FALSE(ConfigurationLoader::parse_area_of_interest("1,2,x,4").has_value());
    REQUIRE_FALSE(ConfigurationLoader::parse_area_of_interest("1,2,3,4deg").has_value());
}
