#pragma once

#include "clues/clue.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flit {

/**
 * @brief Free-flight difficulty tier, selecting which countries can be drawn.
 */
enum class GameDifficulty {
    Easy,
    Normal,
    Hard
};

// Easy pool: rating <= kEasyThreshold. Hard pool: rating >= kHardMinimum.
constexpr double kEasyThreshold = 0.35;
constexpr double kHardMinimum = 0.45;

// Rating used for targets the data set does not rate.
constexpr double kDefaultDifficultyRating = 0.55;

const char* difficultyName(GameDifficulty difficulty);
std::optional<GameDifficulty> difficultyFromName(const std::string& name);

// Inclusive rating bounds for the tier's country pool.
std::pair<std::optional<double>, std::optional<double>> ratingRange(GameDifficulty difficulty);

// Inherent difficulty of a clue category, 0.0-1.0.
double clueTypeDifficulty(ClueType type);

// Clamps to [0, 1]. NaN becomes kDefaultDifficultyRating.
double clampRating(double rating);

// 0.5 + 0.5 * rating. The rating goes through clampRating first.
double difficultyMultiplier(double rating);

// (clueTypeDifficulty + rating) / 2
double roundDifficulty(ClueType type, double rating);

// Mean round difficulty as a 0-100 percentage; 50 when there are no rounds.
int dailyDifficultyPercent(const std::vector<std::pair<ClueType, double>>& rounds);

// Flight-themed label and band index (0-6) for a 0.0-1.0 difficulty.
const char* difficultyLabel(double fraction);
int difficultyBandIndex(double fraction);

} // namespace flit
