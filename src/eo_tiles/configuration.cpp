// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of the environment-driven settings that
// feed the tile tool.
//
// Responsibilities
// - Enforce defaults for mission, log level and AOI corner convention.
// - Surface clear diagnostics via the logging subsystem whenever a value
//   cannot be parsed; the default is used instead.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.

#include "eo_tiles/configuration.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>
#include <vector>

#include "eo_tiles/logging.hpp"
#include "eo_tiles/tile_registry_factory.hpp"

namespace eo_tiles {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};

std::optional<std::string> read_variable(const char* name) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::nullopt;
    }
    return std::string{raw_value};
}

std::optional<std::filesystem::path> read_path(const char* name) {
    const auto raw_value = read_variable(name);
    if (!raw_value) {
        return std::nullopt;
    }
    return std::filesystem::path{*raw_value};
}
}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = read_variable("EO_TILES_LOG_DIR").value_or(std::string{k_default_log_directory});
    config.log_level = read_variable("EO_TILES_LOG_LEVEL").value_or(std::string{k_default_log_level});

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.mission = load_mission();
    config.tile_map_path = read_path("EO_TILES_TILE_MAP");
    config.kml_path = read_path("EO_TILES_KML");
    config.output_path = read_path("EO_TILES_OUTPUT");
    config.area_of_interest = load_area_of_interest();
    config.corner_convention = load_corner_convention();

    logger->info("Configuration loaded: mission={} tile_map={} kml={} output={} aoi={} corner_convention={}",
                 to_string(config.mission),
                 config.tile_map_path ? config.tile_map_path->string() : "-",
                 config.kml_path ? config.kml_path->string() : "-",
                 config.output_path ? config.output_path->string() : "-",
                 config.area_of_interest ? "set" : "-",
                 to_string(config.corner_convention));

    return config;
}

std::optional<AoiCorners> ConfigurationLoader::parse_area_of_interest(const std::string& raw_value) {
    std::vector<double> list_values;
    std::istringstream stream_values{raw_value};
    std::string token;
    while (std::getline(stream_values, token, ',')) {
        try {
            std::size_t consumed = 0;
            const double value = std::stod(token, &consumed);
            if (token.find_first_not_of(" \t", consumed) != std::string::npos) {
                return std::nullopt;
            }
            list_values.push_back(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (list_values.size() != 4) {
        return std::nullopt;
    }
    return AoiCorners{list_values[0], list_values[1], list_values[2], list_values[3]};
}

Mission ConfigurationLoader::load_mission() {
    const auto raw_value = read_variable("EO_TILES_MISSION");
    if (!raw_value) {
        return Mission::Sentinel2;
    }
    const std::optional<Mission> mission = parse_mission(*raw_value);
    if (!mission) {
        get_logger()->warn("Unknown mission {}; defaulting to {}", *raw_value, to_string(Mission::Sentinel2));
        return Mission::Sentinel2;
    }
    return *mission;
}

CornerConvention ConfigurationLoader::load_corner_convention() {
    const auto raw_value = read_variable("EO_TILES_CORNER_CONVENTION");
    if (!raw_value || *raw_value == "literal") {
        return CornerConvention::Literal;
    }
    if (*raw_value == "corrected") {
        return CornerConvention::Corrected;
    }
    get_logger()->warn("Unknown corner convention {}; defaulting to literal", *raw_value);
    return CornerConvention::Literal;
}

std::optional<AoiCorners> ConfigurationLoader::load_area_of_interest() {
    const auto raw_value = read_variable("EO_TILES_AOI");
    if (!raw_value) {
        return std::nullopt;
    }
    auto corners = parse_area_of_interest(*raw_value);
    if (!corners) {
        get_logger()->warn("Failed to parse EO_TILES_AOI '{}'; expected ulx,uly,lrx,lry", *raw_value);
    }
    return corners;
}

}  // namespace eo_tiles
