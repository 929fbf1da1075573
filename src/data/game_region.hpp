#pragma once

#include "math/geo.hpp"
#include <optional>
#include <string>

namespace flit {

enum class GameRegion {
    World,
    UsStates,
    UkCounties,
    Caribbean,
    Ireland
};

// Stable key used in data files and on the command line ("usStates").
const char* regionName(GameRegion region);
const char* regionDisplayName(GameRegion region);
std::optional<GameRegion> regionFromName(const std::string& name);

// Map bounds for the region.
GeoBounds regionBounds(GameRegion region);

} // namespace flit
