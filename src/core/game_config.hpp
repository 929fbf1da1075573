#pragma once

#include "gameplay/landing_detector.hpp"
#include "scoring/difficulty.hpp"
#include <string>

namespace flit {

// Simulated flight used by the command-line driver.
struct FlightConfig {
    double speedDegPerSec = 4.0;
    double fuelBurnPerSec = 0.01;  // fraction of a full tank
};

/**
 * @brief Engine settings read from assets/config/flit.json.
 */
struct GameConfig {
    std::string dataPath = "assets/data/world.json";
    GameDifficulty difficulty = GameDifficulty::Normal;
    int clueBoost = 25;
    LandingThresholds landing;
    FlightConfig flight;
};

// Missing file or keys keep the defaults above.
GameConfig loadGameConfig(const std::string& path);

} // namespace flit
