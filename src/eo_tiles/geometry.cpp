#include "eo_tiles/geometry.hpp"

#include <algorithm>
#include <iterator>

namespace eo_tiles {

Rectangle make_union(const Rectangle& lhs, const Rectangle& rhs) noexcept {
    const double min_x = std::min(lhs.min_x(), rhs.min_x());
    const double min_y = std::min(lhs.min_y(), rhs.min_y());
    const double max_x = std::max(lhs.max_x(), rhs.max_x());
    const double max_y = std::max(lhs.max_y(), rhs.max_y());
    return Rectangle{min_x, min_y, max_x - min_x, max_y - min_y};
}

bool intersects(const Rectangle& lhs, const Rectangle& rhs) noexcept {
    if (lhs.is_empty() || rhs.is_empty()) {
        return false;
    }
    return lhs.min_x() < rhs.max_x()
        && lhs.max_x() > rhs.min_x()
        && lhs.min_y() < rhs.max_y()
        && lhs.max_y() > rhs.min_y();
}

std::optional<Rectangle> bounding_box(const std::vector<Rectangle>& rectangles) {
    if (rectangles.empty()) {
        return std::nullopt;
    }
    Rectangle accumulator = rectangles.front();
    for (auto iterator = std::next(rectangles.begin()); iterator != rectangles.end(); ++iterator) {
        accumulator = make_union(accumulator, *iterator);
    }
    return accumulator;
}

Rectangle rectangle_from_corners(double ulx, double uly, double lrx, double lry, CornerConvention convention) noexcept {
    if (convention == CornerConvention::Corrected) {
        return Rectangle{ulx, lry, lrx - ulx, uly - lry};
    }
    return Rectangle{ulx, uly, ulx - lrx, uly - lry};
}

}  // namespace eo_tiles
