#pragma once

#include "core/game_config.hpp"
#include "core/session/game_session.hpp"
#include "data/json_target_source.hpp"
#include "gameplay/landing_detector.hpp"
#include "math/rng.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace flit {

/**
 * @brief Headless round runner: owns the data set and the active session,
 * and flies a simulated plane straight at the target until it lands.
 */
class App {
public:
    App();

    bool init(const std::string& configPath);

    // Session Management
    bool startRound(const RoundOptions& options);
    bool startSeededRound(uint64_t seed, const ClueOptions& options);
    void endRound();
    bool isRoundActive() const { return m_session != nullptr; }

    // Advances the simulated flight by dt seconds.
    void update(double dt);

    // Spends the next hint tier. The game offers four.
    void useHint();

    GameSession* session() { return m_session.get(); }
    const GameConfig& config() const { return m_config; }
    const TargetSource& targets() const { return *m_targets; }

    const Vec2& planePosition() const { return m_planePosition; }
    double fuelFraction() const { return m_fuelFraction; }
    int hintsUsed() const { return m_hintsUsed; }

    static constexpr double FIXED_DT = 0.5;
    static constexpr int kMaxHints = 4;

private:
    void beginFlight();

    GameConfig m_config;
    std::unique_ptr<JsonTargetSource> m_targets;
    LandingDetector m_landing;
    Rng m_rng;

    // Active Round
    std::unique_ptr<GameSession> m_session;
    Vec2 m_planePosition;
    double m_fuelFraction = 1.0;
    int m_hintsUsed = 0;
};

}
