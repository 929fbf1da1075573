#include "core/game_config.hpp"
#include "utils/config_loader.hpp"
#include <algorithm>
#include <iostream>

namespace flit {

GameConfig loadGameConfig(const std::string& path) {
    GameConfig config;

    auto jsonOpt = loadJsonConfig(path, "GameConfig");
    if (!jsonOpt) {
        std::cerr << "[GameConfig] Using defaults" << std::endl;
        return config;
    }
    const auto& root = *jsonOpt;

    try {
        if (root.contains("data")) {
            config.dataPath = root["data"].value("path", config.dataPath);
        }

        if (root.contains("gameplay")) {
            const auto& gameplay = root["gameplay"];
            std::string name = gameplay.value("difficulty", std::string(difficultyName(config.difficulty)));
            if (auto difficulty = difficultyFromName(name)) {
                config.difficulty = *difficulty;
            } else {
                std::cerr << "[GameConfig] Unknown difficulty '" << name << "', keeping "
                          << difficultyName(config.difficulty) << std::endl;
            }
            config.clueBoost = std::clamp(gameplay.value("clueBoost", config.clueBoost), 0, 100);
        }

        if (root.contains("landing")) {
            const auto& landing = root["landing"];
            config.landing.landingDeg = landing.value("landingDeg", config.landing.landingDeg);
            config.landing.nearDeg = landing.value("nearDeg", config.landing.nearDeg);
            config.landing.approachingDeg = landing.value("approachingDeg", config.landing.approachingDeg);
        }

        if (root.contains("flight")) {
            const auto& flight = root["flight"];
            config.flight.speedDegPerSec = flight.value("speedDegPerSec", config.flight.speedDegPerSec);
            config.flight.fuelBurnPerSec = flight.value("fuelBurnPerSec", config.flight.fuelBurnPerSec);
        }
    } catch (const json::exception& e) {
        std::cerr << "[GameConfig] Invalid value in " << path << ": " << e.what() << std::endl;
        return GameConfig{};
    }

    std::cout << "[GameConfig] Loaded " << path << " (difficulty " << difficultyName(config.difficulty)
              << ", clue boost " << config.clueBoost << ")" << std::endl;
    return config;
}

} // namespace flit
