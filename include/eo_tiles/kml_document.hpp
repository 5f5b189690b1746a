// === KML Document ============================================================
//
// Flattens a KML document into the placemark data the mission registries
// need: names, descriptions, ExtendedData fields and one envelope per polygon.
// Element names are matched without namespace prefixes so both plain and
// "kml:"-qualified documents are accepted.

#pragma once

#include <istream>
#include <map>
#include <string>
#include <vector>

#include "eo_tiles/geometry.hpp"

namespace eo_tiles {

/** @brief Placemark attributes relevant to tile extraction. */
struct KmlPlacemark final {
    std::string name{};                                /**< Trimmed <name> text. */
    std::string description{};                         /**< Raw <description> text. */
    std::map<std::string, std::string> extended_data;  /**< ExtendedData Data/SimpleData name to value. */
    std::vector<Rectangle> polygon_envelopes;          /**< Envelope of each polygon's outer ring. */
};

/**
 * @brief Parse every Placemark in @p kml_stream, in document order.
 *
 * Throws ParseError when the stream is not well-formed XML or a coordinate
 * tuple cannot be read, IoError when the stream fails.
 */
[[nodiscard]] std::vector<KmlPlacemark> read_kml_placemarks(std::istream& kml_stream);

/** @brief Envelope of a KML coordinate list ("lon,lat[,alt] lon,lat[,alt] ..."). */
[[nodiscard]] Rectangle coordinates_envelope(const std::string& coordinates);

}  // namespace eo_tiles
