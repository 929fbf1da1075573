#include "core/app.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace flit {

App::App()
    : m_rng(Rng::fromEntropy()) {
}

bool App::init(const std::string& configPath) {
    m_config = loadGameConfig(configPath);
    m_landing = LandingDetector(m_config.landing);

    try {
        m_targets = std::make_unique<JsonTargetSource>(JsonTargetSource::load(m_config.dataPath));
    } catch (const std::runtime_error& e) {
        std::cerr << "[App] " << e.what() << std::endl;
        return false;
    }
    return true;
}

bool App::startRound(const RoundOptions& options) {
    endRound();

    RoundOptions resolved = options;
    if (!resolved.difficulty) {
        resolved.difficulty = m_config.difficulty;
    }
    if (!resolved.clues.clueBoost) {
        resolved.clues.clueBoost = m_config.clueBoost;
    }

    try {
        m_session = std::make_unique<GameSession>(GameSession::random(*m_targets, m_rng, resolved));
    } catch (const std::runtime_error& e) {
        std::cerr << "[App] Failed to start round: " << e.what() << std::endl;
        return false;
    }

    beginFlight();
    return true;
}

bool App::startSeededRound(uint64_t seed, const ClueOptions& options) {
    endRound();

    try {
        m_session = std::make_unique<GameSession>(GameSession::seeded(*m_targets, seed, options));
    } catch (const std::runtime_error& e) {
        std::cerr << "[App] Failed to start seeded round " << seed << ": " << e.what() << std::endl;
        return false;
    }

    beginFlight();
    return true;
}

void App::beginFlight() {
    m_planePosition = m_session->startPosition();
    m_fuelFraction = 1.0;
    m_hintsUsed = 0;
    m_session->recordPosition(m_planePosition);

    std::cout << "[App] Round started in " << regionDisplayName(m_session->region())
              << ": clue " << clueTypeName(m_session->clue().type)
              << " (" << difficultyLabel(m_session->roundDifficultyScore()) << ")" << std::endl;
}

void App::endRound() {
    m_session.reset();
    m_hintsUsed = 0;
    m_fuelFraction = 1.0;
}

void App::useHint() {
    if (!m_session || m_session->isCompleted()) return;
    m_hintsUsed = std::min(m_hintsUsed + 1, kMaxHints);
}

void App::update(double dt) {
    if (!m_session || m_session->isCompleted()) return;

    const Vec2 target = m_session->targetPosition();
    Vec2 delta = target - m_planePosition;
    double distance = delta.length();
    double step = m_config.flight.speedDegPerSec * dt;

    if (distance <= step) {
        m_planePosition = target;
    } else {
        m_planePosition += delta * (step / distance);
    }

    m_fuelFraction = std::max(0.0, m_fuelFraction - m_config.flight.fuelBurnPerSec * dt);
    m_session->recordPosition(m_planePosition);

    // Descend once the target is near.
    LandingProximity proximity = m_landing.proximity(m_planePosition, target);
    bool lowAltitude = proximity == LandingProximity::Near;
    if (m_landing.checkLanding(m_planePosition, target, lowAltitude)) {
        m_session->complete(m_hintsUsed, m_fuelFraction);
        std::cout << "[App] Landed at " << m_session->targetName() << " after "
                  << m_session->flightPath().size() << " positions" << std::endl;
    }
}

}
