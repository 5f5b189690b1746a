// === Geometry ================================================================
//
// Axis-aligned rectangles in longitude/latitude (or projected X/Y) space and
// the handful of operations the registry queries need: union, intersection
// and the envelope of a rectangle list.

#pragma once

#include <optional>
#include <vector>

#include "eo_tiles/types.hpp"

namespace eo_tiles {

/**
 * @brief Axis-aligned rectangle anchored at its minimum corner.
 *
 * Width and height are kept exactly as supplied. A rectangle with a
 * non-positive width or height is empty and intersects nothing, but it is
 * still stored and serialized unchanged.
 */
struct Rectangle final {
    double x{};       /**< Minimum X (longitude in degrees or projected X). */
    double y{};       /**< Minimum Y (latitude in degrees or projected Y). */
    double width{};   /**< Extent along X. */
    double height{};  /**< Extent along Y. */

    [[nodiscard]] double min_x() const noexcept { return x; }
    [[nodiscard]] double min_y() const noexcept { return y; }
    [[nodiscard]] double max_x() const noexcept { return x + width; }
    [[nodiscard]] double max_y() const noexcept { return y + height; }
    [[nodiscard]] bool is_empty() const noexcept { return width <= 0.0 || height <= 0.0; }

    friend bool operator==(const Rectangle&, const Rectangle&) = default;
};

/** @brief Smallest rectangle containing both @p lhs and @p rhs. */
[[nodiscard]] Rectangle make_union(const Rectangle& lhs, const Rectangle& rhs) noexcept;

/**
 * @brief True when the two rectangles share a region of non-zero area.
 *
 * Empty rectangles never intersect; rectangles touching along an edge or at a
 * corner do not intersect.
 */
[[nodiscard]] bool intersects(const Rectangle& lhs, const Rectangle& rhs) noexcept;

/** @brief Envelope of @p rectangles, or nullopt when the list is empty. */
[[nodiscard]] std::optional<Rectangle> bounding_box(const std::vector<Rectangle>& rectangles);

/**
 * @brief Build an area of interest from upper-left/lower-right corners.
 *
 * CornerConvention::Literal reproduces the historical tile-map behaviour,
 * which yields a negative width whenever @p lrx > @p ulx.
 */
[[nodiscard]] Rectangle rectangle_from_corners(double ulx, double uly, double lrx, double lry,
                                               CornerConvention convention) noexcept;

}  // namespace eo_tiles
