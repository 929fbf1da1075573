#include "data/game_region.hpp"

namespace flit {

const char* regionName(GameRegion region) {
    switch (region) {
        case GameRegion::World: return "world";
        case GameRegion::UsStates: return "usStates";
        case GameRegion::UkCounties: return "ukCounties";
        case GameRegion::Caribbean: return "caribbean";
        case GameRegion::Ireland: return "ireland";
    }
    return "world";
}

const char* regionDisplayName(GameRegion region) {
    switch (region) {
        case GameRegion::World: return "World";
        case GameRegion::UsStates: return "US States";
        case GameRegion::UkCounties: return "UK Counties";
        case GameRegion::Caribbean: return "Caribbean";
        case GameRegion::Ireland: return "Ireland";
    }
    return "World";
}

std::optional<GameRegion> regionFromName(const std::string& name) {
    for (GameRegion region : {GameRegion::World, GameRegion::UsStates, GameRegion::UkCounties,
                              GameRegion::Caribbean, GameRegion::Ireland}) {
        if (name == regionName(region)) {
            return region;
        }
    }
    return std::nullopt;
}

GeoBounds regionBounds(GameRegion region) {
    switch (region) {
        case GameRegion::World: return {-180.0, -85.0, 180.0, 85.0};
        case GameRegion::UsStates: return {-125.0, 24.0, -66.0, 50.0};
        case GameRegion::UkCounties: return {-11.0, 49.0, 3.0, 61.0};
        case GameRegion::Caribbean: return {-85.0, 10.0, -59.0, 28.0};
        case GameRegion::Ireland: return {-11.0, 51.0, -5.0, 56.0};
    }
    return {};
}

} // namespace flit
