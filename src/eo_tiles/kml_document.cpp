#include "eo_tiles/kml_document.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <pugixml.hpp>

#include "eo_tiles/errors.hpp"
#include "eo_tiles/logging.hpp"
#include "eo_tiles/tile_map_format.hpp"

namespace eo_tiles {

namespace {
constexpr std::string_view k_whitespace{" \t\r\n"};

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(k_whitespace);
    return std::string{text.substr(first, last - first + 1)};
}

std::string_view local_name(const pugi::xml_node& node) {
    const std::string_view qualified_name{node.name()};
    const auto colon = qualified_name.find(':');
    return colon == std::string_view::npos ? qualified_name : qualified_name.substr(colon + 1);
}

pugi::xml_node child_named(const pugi::xml_node& parent, std::string_view name) {
    for (const pugi::xml_node& child : parent.children()) {
        if (child.type() == pugi::node_element && local_name(child) == name) {
            return child;
        }
    }
    return {};
}

template <typename Visitor>
void for_each_descendant(const pugi::xml_node& root, std::string_view name, Visitor&& visitor) {
    for (const pugi::xml_node& child : root.children()) {
        if (child.type() != pugi::node_element) {
            continue;
        }
        if (local_name(child) == name) {
            visitor(child);
            continue;
        }
        for_each_descendant(child, name, visitor);
    }
}

double parse_ordinate(const std::string& token, const std::string& tuple) {
    const std::optional<double> value = parse_decimal(token);
    if (!value) {
        throw ParseError(fmt::format("malformed KML coordinate tuple '{}'", tuple));
    }
    return *value;
}

void collect_extended_data(const pugi::xml_node& placemark, KmlPlacemark& result) {
    const pugi::xml_node extended_data = child_named(placemark, "ExtendedData");
    if (!extended_data) {
        return;
    }
    for_each_descendant(extended_data, "Data", [&result](const pugi::xml_node& data) {
        result.extended_data[data.attribute("name").value()] = trim(child_named(data, "value").text().get());
    });
    for_each_descendant(extended_data, "SimpleData", [&result](const pugi::xml_node& data) {
        result.extended_data[data.attribute("name").value()] = trim(data.text().get());
    });
}

void collect_polygons(const pugi::xml_node& placemark, KmlPlacemark& result) {
    for_each_descendant(placemark, "Polygon", [&result](const pugi::xml_node& polygon) {
        const pugi::xml_node ring = child_named(child_named(polygon, "outerBoundaryIs"), "LinearRing");
        const pugi::xml_node coordinates = child_named(ring, "coordinates");
        if (!coordinates) {
            throw ParseError(fmt::format("polygon in placemark '{}' has no outer boundary coordinates", result.name));
        }
        result.polygon_envelopes.push_back(coordinates_envelope(coordinates.text().get()));
    });
}
}  // namespace

Rectangle coordinates_envelope(const std::string& coordinates) {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
    std::size_t tuple_count = 0;

    std::istringstream stream_tuples{coordinates};
    std::string tuple;
    while (stream_tuples >> tuple) {
        const auto first_comma = tuple.find(',');
        if (first_comma == std::string::npos) {
            throw ParseError(fmt::format("malformed KML coordinate tuple '{}'", tuple));
        }
        const auto second_comma = tuple.find(',', first_comma + 1);
        const std::string str_lon = tuple.substr(0, first_comma);
        const std::string str_lat = second_comma == std::string::npos
            ? tuple.substr(first_comma + 1)
            : tuple.substr(first_comma + 1, second_comma - first_comma - 1);
        const double lon = parse_ordinate(str_lon, tuple);
        const double lat = parse_ordinate(str_lat, tuple);

        min_x = std::min(min_x, lon);
        max_x = std::max(max_x, lon);
        min_y = std::min(min_y, lat);
        max_y = std::max(max_y, lat);
        ++tuple_count;
    }

    if (tuple_count == 0) {
        throw ParseError("empty KML coordinate list");
    }
    return Rectangle{min_x, min_y, max_x - min_x, max_y - min_y};
}

std::vector<KmlPlacemark> read_kml_placemarks(std::istream& kml_stream) {
    pugi::xml_document document;
    const pugi::xml_parse_result result = document.load(kml_stream);
    if (kml_stream.bad()) {
        throw IoError("Failed to read KML stream");
    }
    if (!result) {
        throw ParseError(fmt::format("malformed KML at offset {}: {}", result.offset, result.description()));
    }

    std::vector<KmlPlacemark> list_placemarks;
    for_each_descendant(document, "Placemark", [&list_placemarks](const pugi::xml_node& placemark) {
        KmlPlacemark entry{};
        entry.name = trim(child_named(placemark, "name").text().get());
        entry.description = child_named(placemark, "description").text().get();
        collect_extended_data(placemark, entry);
        collect_polygons(placemark, entry);
        list_placemarks.push_back(std::move(entry));
    });

    get_logger()->debug("Read {} placemarks from KML document", list_placemarks.size());
    return list_placemarks;
}

}  // namespace eo_tiles
