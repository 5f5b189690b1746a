// === Tile Map Format =========================================================
//
// Line codec for persisted tile maps. Each line holds one tile:
//
//     31TGM x=2.0,y=40.0,w=1.0,h=1.0
//
// The identifier is separated from its fields by the first whitespace
// character; the four fields always appear in x, y, w, h order.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "eo_tiles/geometry.hpp"
#include "eo_tiles/types.hpp"

namespace eo_tiles {

/** @brief One decoded tile map line. */
struct TileEntry final {
    TileId tile_id{};
    Rectangle rectangle{};
};

/**
 * @brief Decode one tile map line.
 *
 * Returns nullopt for lines that are blank after trimming. Throws ParseError,
 * tagged with @p line_number, when the identifier separator is missing, the
 * field count is not four, a field key is out of order, or a value is not a
 * number.
 */
[[nodiscard]] std::optional<TileEntry> parse_tile_line(std::string_view line, std::size_t line_number);

/** @brief Encode one tile as a newline-terminated tile map line. */
[[nodiscard]] std::string format_tile_line(const TileId& tile_id, const Rectangle& rectangle);

/**
 * @brief Parse @p text as a double, requiring the whole string to be consumed.
 *
 * Values outside the double range keep the nearest representable result:
 * "1e400" gives infinity and "4.9E-324" the smallest subnormal.
 */
[[nodiscard]] std::optional<double> parse_decimal(const std::string& text);

/**
 * @brief Shortest decimal text that parses back to exactly @p value.
 *
 * Integral values keep a ".0" suffix so files stay readable by older
 * tile map consumers ("2.0" rather than "2").
 */
[[nodiscard]] std::string format_coordinate(double value);

}  // namespace eo_tiles
