#pragma once

#include "clues/clue.hpp"
#include "core/session/round_options.hpp"
#include "data/country_shape.hpp"
#include "data/target_source.hpp"
#include "math/vec2.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace flit {

class Rng;

/**
 * @brief Everything a session needs to know about what the player is looking for.
 *
 * Lookups against the data source happen once, when this is built, so that
 * scoring and target position stay pure functions of session state.
 */
struct RoundTarget {
    CountryShape country;
    std::optional<RegionalArea> area;
    std::optional<CapitalCity> capital;
    double difficultyRating = kDefaultDifficultyRating;
};

/**
 * @brief One round of play: ground truth, telemetry and scoring.
 *
 * A session is mutated only by recordPosition() during play and by the
 * first complete() call. It is not synchronised; the game loop that
 * created it owns it.
 */
class GameSession {
public:
    using Clock = std::chrono::system_clock;

    // Throws std::invalid_argument if the clue describes a different target.
    GameSession(RoundTarget target, Clue clue, const Vec2& startPosition,
                GameRegion region = GameRegion::World);

    // Builds a country round, resolving capital and rating through the source.
    static GameSession create(const TargetSource& source, const CountryShape& target,
                              Clue clue, const Vec2& startPosition);

    /**
     * @brief Round drawn from @p rng.
     *
     * World rounds pick a country from the difficulty tier's pool and start
     * at longitude [-180, 180), latitude [-70, 70). Regional rounds pick an
     * area of the region and start inside the region bounds.
     *
     * Throws std::runtime_error when the candidate pool is empty.
     */
    static GameSession random(const TargetSource& source, Rng& rng, const RoundOptions& options = {});

    /**
     * @brief Reproducible world round for challenges and daily rounds.
     *
     * Draws, in order, the target index from the full playable pool, the
     * clue, the start longitude and the start latitude from a generator
     * seeded with @p seed. Identical seeds and data give identical rounds.
     */
    static GameSession seeded(const TargetSource& source, uint64_t seed, const ClueOptions& options = {});

    void recordPosition(const Vec2& position);

    // First call finalises the round; later calls are ignored.
    void complete(int hintsUsed = 0, double fuelFraction = 1.0);

    int rawScore() const;
    int score() const;

    Vec2 targetPosition() const;
    const std::string& targetName() const;
    double roundDifficultyScore() const;

    // Time to completion, or time so far while the round is active.
    std::chrono::milliseconds elapsed() const;

    bool isCompleted() const { return m_completed; }
    const CountryShape& target() const { return m_target.country; }
    const std::optional<RegionalArea>& targetArea() const { return m_target.area; }
    double difficultyRating() const { return m_target.difficultyRating; }
    const Clue& clue() const { return m_clue; }
    const Vec2& startPosition() const { return m_startPosition; }
    GameRegion region() const { return m_region; }
    Clock::time_point startTime() const { return m_startTime; }
    const std::optional<Clock::time_point>& endTime() const { return m_endTime; }
    const std::vector<Vec2>& flightPath() const { return m_flightPath; }
    int hintsUsed() const { return m_hintsUsed; }
    double fuelFraction() const { return m_fuelFraction; }

private:
    static GameSession worldRound(const TargetSource& source, const std::vector<CountryShape>& pool,
                                  Rng& rng, const ClueOptions& options);

    RoundTarget m_target;
    Clue m_clue;
    Vec2 m_startPosition;
    GameRegion m_region = GameRegion::World;
    Clock::time_point m_startTime;

    std::optional<Clock::time_point> m_endTime;
    bool m_completed = false;
    std::vector<Vec2> m_flightPath;
    int m_hintsUsed = 0;
    double m_fuelFraction = 1.0;
};

} // namespace flit
