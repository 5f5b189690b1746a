// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs.

#pragma once

#include <string_view>

namespace eo_tiles {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace eo_tiles
