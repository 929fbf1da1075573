#pragma once

#include "clues/clue.hpp"
#include "data/game_region.hpp"
#include "scoring/difficulty.hpp"
#include <optional>
#include <set>

namespace flit {

struct ClueOptions {
    // Restricts the clue type pool; empty means every type is allowed.
    std::set<ClueType> allowedClueTypes;
    std::optional<ClueType> preferredClueType;
    // Percent chance of taking the preferred type on each attempt. Unset
    // means no boost here; App fills it from GameConfig.
    std::optional<int> clueBoost;
};

/**
 * @brief Parameters for GameSession::random.
 *
 * difficulty defaults to Normal when unset; callers holding a current
 * difficulty setting pass it here.
 */
struct RoundOptions {
    GameRegion region = GameRegion::World;
    std::optional<GameDifficulty> difficulty;
    ClueOptions clues;
};

} // namespace flit
