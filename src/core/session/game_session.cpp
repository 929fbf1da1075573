#include "core/session/game_session.hpp"
#include "clues/clue_factory.hpp"
#include "math/geo.hpp"
#include "math/rng.hpp"
#include "scoring/difficulty.hpp"
#include "scoring/round_score.hpp"
#include <stdexcept>
#include <utility>

namespace flit {

namespace {
// Start positions avoid the extreme polar latitudes.
const GeoBounds kWorldStartBounds{-180.0, -70.0, 180.0, 70.0};

template<typename T>
const T& pick(const std::vector<T>& pool, Rng& rng) {
    return pool[static_cast<std::size_t>(rng.nextInt(static_cast<int>(pool.size())))];
}
}

GameSession::GameSession(RoundTarget target, Clue clue, const Vec2& startPosition, GameRegion region)
    : m_target(std::move(target)),
      m_clue(std::move(clue)),
      m_startPosition(startPosition),
      m_region(region),
      m_startTime(Clock::now()) {
    if (m_clue.targetCode != m_target.country.code) {
        throw std::invalid_argument("Clue for " + m_clue.targetCode +
                                    " does not describe target " + m_target.country.code);
    }
}

GameSession GameSession::create(const TargetSource& source, const CountryShape& target,
                                Clue clue, const Vec2& startPosition) {
    RoundTarget round;
    round.country = target;
    round.capital = source.capital(target.code);
    round.difficultyRating = source.difficultyRating(target.code);
    return GameSession(std::move(round), std::move(clue), startPosition);
}

GameSession GameSession::worldRound(const TargetSource& source, const std::vector<CountryShape>& pool,
                                    Rng& rng, const ClueOptions& options) {
    const CountryShape& country = pick(pool, rng);
    Clue clue = ClueFactory::forCountry(source, country.code, rng, options.allowedClueTypes,
                                        options.preferredClueType, options.clueBoost.value_or(0));
    Vec2 start = kWorldStartBounds.sample(rng);
    return create(source, country, std::move(clue), start);
}

GameSession GameSession::random(const TargetSource& source, Rng& rng, const RoundOptions& options) {
    if (options.region == GameRegion::World) {
        GameDifficulty difficulty = options.difficulty.value_or(GameDifficulty::Normal);
        std::vector<CountryShape> pool;
        if (difficulty == GameDifficulty::Normal) {
            pool = source.playableCountries();
        } else {
            auto [minRating, maxRating] = ratingRange(difficulty);
            pool = source.targetsFiltered(minRating, maxRating);
        }
        if (pool.empty()) {
            throw std::runtime_error(std::string("No playable countries for difficulty tier: ") +
                                     difficultyName(difficulty));
        }
        return worldRound(source, pool, rng, options.clues);
    }

    std::vector<RegionalArea> areas = source.areas(options.region);
    if (areas.empty()) {
        throw std::runtime_error(std::string("No areas defined for region: ") + regionName(options.region));
    }

    const RegionalArea& area = pick(areas, rng);
    Clue clue = ClueFactory::forRegionalArea(area, rng);
    Vec2 start = regionBounds(options.region).sample(rng);

    RoundTarget round;
    round.country = area.asCountry();
    round.area = area;
    round.difficultyRating = area.difficulty.value_or(source.difficultyRating(area.code));
    return GameSession(std::move(round), std::move(clue), start, options.region);
}

GameSession GameSession::seeded(const TargetSource& source, uint64_t seed, const ClueOptions& options) {
    const auto& pool = source.playableCountries();
    if (pool.empty()) {
        throw std::runtime_error("No playable countries for seeded round");
    }
    Rng rng(seed);
    return worldRound(source, pool, rng, options);
}

void GameSession::recordPosition(const Vec2& position) {
    m_flightPath.push_back(position);
}

void GameSession::complete(int hintsUsed, double fuelFraction) {
    if (m_completed) {
        return;
    }
    m_completed = true;
    m_hintsUsed = hintsUsed;
    m_fuelFraction = clampFuelFraction(fuelFraction);
    m_endTime = Clock::now();
}

int GameSession::rawScore() const {
    if (!m_completed) return 0;
    return rawRoundScore(m_hintsUsed, m_fuelFraction);
}

int GameSession::score() const {
    if (!m_completed) return 0;
    return finalRoundScore(rawScore(), m_target.difficultyRating);
}

Vec2 GameSession::targetPosition() const {
    if (m_target.area) {
        return centroid(m_target.area->points);
    }
    if (m_target.capital) {
        return m_target.capital->location;
    }
    return centroid(m_target.country.allPoints());
}

const std::string& GameSession::targetName() const {
    return m_target.area ? m_target.area->name : m_target.country.name;
}

double GameSession::roundDifficultyScore() const {
    return roundDifficulty(m_clue.type, m_target.difficultyRating);
}

std::chrono::milliseconds GameSession::elapsed() const {
    Clock::time_point end = m_endTime.value_or(Clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - m_startTime);
}

} // namespace flit
