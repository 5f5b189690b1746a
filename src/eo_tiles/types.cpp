#include "eo_tiles/types.hpp"

namespace eo_tiles {

std::string_view to_string(Mission mission) noexcept {
    switch (mission) {
        case Mission::Sentinel2:
            return "sentinel2";
        case Mission::Landsat8:
            return "landsat8";
    }
    return "unknown";
}

std::string_view to_string(CornerConvention convention) noexcept {
    switch (convention) {
        case CornerConvention::Literal:
            return "literal";
        case CornerConvention::Corrected:
            return "corrected";
    }
    return "unknown";
}

}  // namespace eo_tiles
